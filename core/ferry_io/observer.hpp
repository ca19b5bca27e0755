// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_IO_OBSERVER_HPP
#define FERRY_IO_OBSERVER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "io_interfaces.hpp"

namespace ferry {
namespace io {

enum class TransferDirection { Read, Write };

/**
 * One successful transfer through an observed source or sink
 */
struct TransferEvent {
  TransferDirection direction;
  uint64_t bytes;
};

using TransferObserver = std::function<void(const TransferEvent& event)>;

/**
 * Source wrapper reporting every segment it yields
 *
 * The observer runs synchronously before next() returns. Failed pulls and
 * end-of-data report nothing. Bytes pass through untouched.
 */
class ObservedSource : public ISource {
public:
  ObservedSource(std::unique_ptr<ISource> inner, TransferObserver observer);

  Status next(Bytes& segment) override;

private:
  std::unique_ptr<ISource> inner_;
  TransferObserver observer_;
};

/**
 * Sink wrapper reporting every segment it accepts
 */
class ObservedSink : public ISink {
public:
  ObservedSink(std::unique_ptr<ISink> inner, TransferObserver observer);

  Status push(const Bytes& segment) override;
  Status finish() override;

private:
  std::unique_ptr<ISink> inner_;
  TransferObserver observer_;
};

/**
 * Thread-safe running totals, usable as a TransferObserver
 *
 * Usage:
 *   TransferCounter counter;
 *   ObservedSource source(std::move(inner), counter.observer());
 */
class TransferCounter {
public:
  void record(const TransferEvent& event);

  /**
   * Observer bound to this counter; the counter must outlive it
   */
  TransferObserver observer();

  uint64_t bytes() const {
    return bytes_.load();
  }

  uint64_t events() const {
    return events_.load();
  }

private:
  std::atomic<uint64_t> bytes_{0};
  std::atomic<uint64_t> events_{0};
};

}  // namespace io
}  // namespace ferry

#endif  // FERRY_IO_OBSERVER_HPP
