// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "observer.hpp"

#include <utility>

namespace ferry {
namespace io {

ObservedSource::ObservedSource(std::unique_ptr<ISource> inner, TransferObserver observer)
    : inner_(std::move(inner))
    , observer_(std::move(observer)) {}

Status ObservedSource::next(Bytes& segment) {
  Status status = inner_->next(segment);
  if (status.ok() && !segment.empty() && observer_) {
    observer_(TransferEvent{TransferDirection::Read, segment.size()});
  }
  return status;
}

ObservedSink::ObservedSink(std::unique_ptr<ISink> inner, TransferObserver observer)
    : inner_(std::move(inner))
    , observer_(std::move(observer)) {}

Status ObservedSink::push(const Bytes& segment) {
  Status status = inner_->push(segment);
  if (status.ok() && !segment.empty() && observer_) {
    observer_(TransferEvent{TransferDirection::Write, segment.size()});
  }
  return status;
}

Status ObservedSink::finish() {
  return inner_->finish();
}

void TransferCounter::record(const TransferEvent& event) {
  bytes_ += event.bytes;
  ++events_;
}

TransferObserver TransferCounter::observer() {
  return [this](const TransferEvent& event) { record(event); };
}

}  // namespace io
}  // namespace ferry
