// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// ferry_put - upload local files to OneDrive
// Small payloads go out in one request; larger ones through an upload session.

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <adapters.hpp>
#include <beast_http_client.hpp>
#include <chunked_upload_writer.hpp>
#include <config_parser.hpp>
#include <decompress.hpp>
#include <observer.hpp>
#include <onedrive_backend.hpp>
#include <walker.hpp>

#define FERRY_LOG_COMPONENT "ferry_put"
#include <ferry_log_init.hpp>
#include <ferry_log_macros.hpp>

namespace ferry {
namespace put {

using logging::kv;

namespace {

void print_usage(const char* program) {
  std::cout << "Usage: " << program << " [options] <local_path> <remote_path>\n"
            << "\n"
            << "Upload a local file, or every file under a local directory, to OneDrive.\n"
            << "\n"
            << "Options:\n"
            << "  --config <file>         YAML configuration file\n"
            << "  --token <token>         OneDrive access token (default: FERRY_ONEDRIVE_TOKEN)\n"
            << "  --base-url <url>        Microsoft Graph drive owner URL\n"
            << "  --content-type <type>   Content type of single-shot uploads\n"
            << "  --decompress <alg>      Upload decoded content: auto, gzip, zlib, zstd, lz4,\n"
            << "                          bz2, brotli (default: none)\n"
            << "  --conflict <behavior>   replace, rename or fail (default: replace)\n"
            << "  -h, --help              Show this help\n"
            << "\n"
            << "A remote path ending in '/' receives the local file name, or the\n"
            << "directory tree when the local path is a directory.\n";
}

struct PutOptions {
  std::string content_type;
};

/**
 * Build the source chain for one local file:
 * file -> segments -> read observer -> optional decoder
 */
io::Status open_payload(
  const std::string& local_path, const config::FerryConfig& config, io::TransferCounter& counter,
  std::unique_ptr<io::ISource>& source, std::optional<uint64_t>& total_size
) {
  std::unique_ptr<io::FileReader> file;
  io::Status status = io::FileReader::open(local_path, file);
  if (!status.ok()) {
    return status;
  }
  uint64_t file_size = file->size();

  std::unique_ptr<io::ISource> chain = std::make_unique<io::ReaderSource>(
    std::move(file), static_cast<size_t>(config.io.segment_size)
  );
  chain = std::make_unique<io::ObservedSource>(std::move(chain), counter.observer());

  if (config.io.decompress == "none") {
    total_size = file_size;
    source = std::move(chain);
    return io::Status::Success();
  }

  io::CompressAlgorithm algorithm = io::CompressAlgorithm::Auto;
  if (config.io.decompress == "auto") {
    if (auto from_path = io::compressAlgorithmFromPath(local_path)) {
      algorithm = *from_path;
    }
  } else if (auto parsed = io::parseCompressAlgorithm(config.io.decompress)) {
    algorithm = *parsed;
  }

  std::unique_ptr<io::DecompressSource> decoded;
  status = io::DecompressSource::create(
    std::move(chain), algorithm, decoded, static_cast<size_t>(config.io.segment_size)
  );
  if (!status.ok()) {
    return status;
  }
  // Decoded length is only known after decoding
  total_size.reset();
  source = std::move(decoded);
  return io::Status::Success();
}

io::Status put_file(
  const std::string& local_path, const std::string& remote_path, const config::FerryConfig& config,
  const PutOptions& options, std::shared_ptr<uploader::IUploadBackend> backend
) {
  io::TransferCounter counter;
  std::unique_ptr<io::ISource> source;
  std::optional<uint64_t> total_size;

  io::Status status = open_payload(local_path, config, counter, source, total_size);
  if (!status.ok()) {
    return status;
  }

  uploader::WriteContext context;
  context.path = remote_path;
  context.total_size = total_size;
  if (!options.content_type.empty()) {
    context.content_type = options.content_type;
  }

  auto start = std::chrono::steady_clock::now();
  uploader::ChunkedUploadWriter writer(backend, context, config.upload);
  status = writer.writeFrom(std::move(source));
  if (!status.ok()) {
    return status;
  }
  status = writer.close();
  if (!status.ok()) {
    return status;
  }

  double seconds =
    std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  FERRY_LOG_INFO(
    "uploaded" << kv("local", local_path) << kv("remote", remote_path)
               << kv("bytes_read", counter.bytes()) << kv("seconds", seconds)
  );
  return io::Status::Success();
}

io::Status put_tree(
  const std::string& local_root, const std::string& remote_prefix, const config::FerryConfig& config,
  const PutOptions& options, std::shared_ptr<uploader::IUploadBackend> backend, int& uploaded
) {
  io::LocalListingProvider provider(local_root);
  io::TopDownWalker walker(provider, "/");

  std::optional<io::WalkNode> node;
  while (true) {
    io::Status status = walker.next(node);
    if (!status.ok()) {
      return status;
    }
    if (!node) {
      return io::Status::Success();
    }
    if (node->is_container) {
      FERRY_LOG_DEBUG("entering directory" << kv("key", node->key));
      continue;
    }

    status = put_file(provider.localPath(node->key), remote_prefix + node->key, config, options, backend);
    if (!status.ok()) {
      return status;
    }
    ++uploaded;
  }
}

}  // namespace

int run(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  std::string config_file;
  std::string cli_token;
  std::string cli_base_url;
  std::string cli_conflict;
  std::string cli_decompress;
  PutOptions options;
  std::string local_path;
  std::string remote_path;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--config") == 0) {
      if (i + 1 < argc) {
        config_file = argv[++i];
      } else {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--token") == 0) {
      if (i + 1 < argc) {
        cli_token = argv[++i];
      } else {
        std::cerr << "Error: --token requires a token argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--base-url") == 0) {
      if (i + 1 < argc) {
        cli_base_url = argv[++i];
      } else {
        std::cerr << "Error: --base-url requires a URL argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--content-type") == 0) {
      if (i + 1 < argc) {
        options.content_type = argv[++i];
      } else {
        std::cerr << "Error: --content-type requires a type argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--decompress") == 0) {
      if (i + 1 < argc) {
        cli_decompress = argv[++i];
      } else {
        std::cerr << "Error: --decompress requires an algorithm argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--conflict") == 0) {
      if (i + 1 < argc) {
        cli_conflict = argv[++i];
      } else {
        std::cerr << "Error: --conflict requires a behavior argument" << std::endl;
        return 1;
      }
    } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 1;
    } else if (local_path.empty()) {
      local_path = argv[i];
    } else if (remote_path.empty()) {
      remote_path = argv[i];
    } else {
      std::cerr << "Error: Unexpected argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  if (local_path.empty() || remote_path.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  // Step 1: configuration file, then command line overrides
  config::FerryConfig config;
  if (!config_file.empty()) {
    config::ConfigParser parser;
    if (!parser.load_from_file(config_file, config)) {
      std::cerr << "Error: " << parser.last_error() << std::endl;
      return 1;
    }
  }
  if (!cli_token.empty()) {
    config.onedrive.access_token = cli_token;
  }
  if (!cli_base_url.empty()) {
    config.onedrive.base_url = cli_base_url;
  }
  if (!cli_conflict.empty()) {
    config.upload.conflict_behavior = cli_conflict;
  }
  if (!cli_decompress.empty()) {
    config.io.decompress = cli_decompress;
  }

  std::string error_msg;
  if (!config::ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return 1;
  }

  // Step 2: logging
  logging::LoggingConfig log_config;
  config::convert_logging_config(config.logging, log_config);
  logging::apply_env_overrides(log_config);
  logging::ScopedLogging logging_guard(log_config);

  // Step 3: transport and backend
  uploader::BeastHttpClient::Config http_config;
  http_config.request_timeout = std::chrono::seconds(config.http.request_timeout_sec);
  http_config.verify_peer = config.http.verify_ssl;
  http_config.user_agent = config.http.user_agent;
  auto http_client = std::make_shared<uploader::BeastHttpClient>(http_config);
  auto backend = std::make_shared<uploader::OneDriveBackend>(config.onedrive, http_client);

  // Step 4: upload
  std::error_code ec;
  bool is_directory = std::filesystem::is_directory(local_path, ec);
  io::Status status = io::Status::Success();
  int uploaded = 0;

  if (is_directory) {
    std::string prefix = remote_path.back() == '/' ? remote_path : remote_path + "/";
    status = put_tree(local_path, prefix, config, options, backend, uploaded);
  } else {
    std::string target = remote_path;
    if (target.back() == '/') {
      target += std::filesystem::path(local_path).filename().string();
    }
    status = put_file(local_path, target, config, options, backend);
    if (status.ok()) {
      uploaded = 1;
    }
  }

  int exit_code = 0;
  if (!status.ok()) {
    FERRY_LOG_ERROR("upload failed" << kv("local", local_path) << kv("error", status.toString()));
    std::cerr << "Error: " << status.toString() << std::endl;
    exit_code = status.is_retryable ? 75 : 1;  // EX_TEMPFAIL for transient failures
  } else {
    FERRY_LOG_INFO("done" << kv("files", uploaded));
  }

  return exit_code;
}

}  // namespace put
}  // namespace ferry

int main(int argc, char* argv[]) {
  try {
    return ferry::put::run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
