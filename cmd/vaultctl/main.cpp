#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "client/cpp/archive_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/packaging/archive_request.hpp"
#include "internal/packaging/source_scanner.hpp"
#include "internal/packaging/zip_reader.hpp"
#include "internal/util/time.hpp"

using namespace vault::archive::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vaultctl [--config <client.yaml>] [--endpoint <addr>] upload [--tags a,b] [--policy standard] <path>...\n"
            << "  vaultctl [--config <client.yaml>] [--endpoint <addr>] get <file_id>\n"
            << "  vaultctl [--config <client.yaml>] [--endpoint <addr>] download <file_id> <out_path>\n"
            << "  vaultctl list-zip <archive.zip>\n";
}

static void PrintRecord(const ArchiveRecord& record) {
  std::cout << "file_id:      " << record.file_id() << "\n"
            << "filename:     " << record.original_filename() << "\n"
            << "size_bytes:   " << record.size_bytes() << "\n"
            << "content_type: " << record.content_type() << "\n"
            << "policy:       " << vault::packaging::RetentionPolicyName(record.retention_policy()) << "\n"
            << "status:       " << ArchiveStatus_Name(record.status()) << "\n"
            << "archived_at:  " << vault::util::FormatCompactUtc(vault::util::FromProto(record.archived_at())) << "\n"
            << "fingerprint:  " << record.content_fingerprint() << "\n"
            << "tags:        ";
  for (const auto& tag : record.tags()) std::cout << " " << tag;
  std::cout << "\n";
}

static int ListZip(const std::string& path) {
  auto reader = vault::packaging::ZipReader::OpenPath(path);
  for (const auto& entry : reader.Entries()) {
    std::cout << std::setw(12) << entry.size << "  " << std::hex << std::setw(8) << std::setfill('0') << entry.crc32 << std::dec
              << std::setfill(' ') << "  " << entry.name << "\n";
  }
  std::cout << reader.Entries().size() << " entries\n";
  return 0;
}

static int Fail(const arrow::Status& status) {
  std::cerr << "error: " << status.ToString() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  std::string endpoint;
  size_t      i = 0;
  for (; i < args.size(); ++i) {
    if (args[i] == "--config" && i + 1 < args.size()) {
      config_path = args[++i];
    } else if (args[i] == "--endpoint" && i + 1 < args.size()) {
      endpoint = args[++i];
    } else {
      break;
    }
  }
  if (i >= args.size()) {
    Usage();
    return 1;
  }
  const std::string cmd = args[i++];

  try {
    if (cmd == "list-zip") {
      if (i + 1 != args.size()) {
        Usage();
        return 1;
      }
      return ListZip(args[i]);
    }

    vault::runtime::config::ClientConfig config;
    if (!config_path.empty()) {
      config = vault::config::ConfigLoader::LoadClientFromYaml(config_path);
    } else {
      vault::config::ConfigLoader::ApplyDefaults(config);
      vault::config::ConfigLoader::Validate(config);
    }
    if (!endpoint.empty()) config.set_endpoint(endpoint);
    vault::observability::InitializeLogging(config.logging(), "vaultctl");

    vault::client::ArchiveClient client(vault::client::ArchiveClient::Connect(config.endpoint()), config.transfer());

    if (cmd == "upload") {
      std::string              tags;
      std::string              policy = "standard";
      std::vector<std::string> paths;
      for (; i < args.size(); ++i) {
        if (args[i] == "--tags" && i + 1 < args.size()) {
          tags = args[++i];
        } else if (args[i] == "--policy" && i + 1 < args.size()) {
          policy = args[++i];
        } else {
          paths.push_back(args[i]);
        }
      }
      if (paths.empty()) {
        Usage();
        return 1;
      }

      auto request = vault::packaging::MakeArchiveRequest(vault::packaging::CollectSources(paths), vault::packaging::ParseTags(tags),
                                                          vault::packaging::ParseRetentionPolicy(policy));

      client.SetProgressListener([](const vault::transfer::ProgressEvent& event) {
        std::cerr << "\rpart " << event.parts_done << "/" << event.part_count << "  " << event.bytes_done << "/" << event.total_bytes
                  << " bytes" << std::flush;
        if (event.parts_done == event.part_count) std::cerr << "\n";
      });

      auto outcome = client.Upload(request);
      if (!outcome.ok()) return Fail(outcome.status());

      std::cout << "mode:         " << vault::transfer::ToString(outcome->mode) << "\n";
      if (outcome->part_count > 0) std::cout << "parts:        " << outcome->part_count << "\n";
      PrintRecord(outcome->record);
      return 0;
    }

    if (cmd == "get") {
      if (i + 1 != args.size()) {
        Usage();
        return 1;
      }
      auto record = client.GetArchive(args[i]);
      if (!record.ok()) return Fail(record.status());
      PrintRecord(*record);
      return 0;
    }

    if (cmd == "download") {
      if (i + 2 != args.size()) {
        Usage();
        return 1;
      }
      auto written = client.Download(args[i], args[i + 1]);
      if (!written.ok()) return Fail(written.status());
      std::cout << *written << " bytes written to " << args[i + 1] << "\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
