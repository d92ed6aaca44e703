#include "store/chunk_store.hpp"
#include "store/store_error.hpp"
#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace chunkvault;

static void usage() {
  std::cout << "Usage: chunkvault_ctl [--config FILE] <command>\n"
            << "  put <path>             store a file\n"
            << "  get <hash> <out>       write a stored file to <out>\n"
            << "  rm <hash>              release one reference to a file\n"
            << "  info <hash>            show a file's chunk manifest\n"
            << "  stats [--prometheus]   show storage statistics\n"
            << "  verify <hash>          re-hash every chunk of a file\n"
            << "  gc [--dry-run]         remove orphaned chunk payloads\n";
}

static void initLogging(const RuntimeOptions &opts) {
  std::string logFile = opts.logFile;
  if (logFile.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(logsDir(), ec);
    logFile = ec ? Logger::CONSOLE_ONLY_OUTPUT
                 : logsDir() + "/chunkvault_ctl.log";
  }
  Logger::init(logFile, opts.logLevel, opts.logMaxFileSize,
               opts.logMaxBackupFiles);
}

static int put_command(ChunkStore &store, const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    std::cout << "Cannot open " << path << std::endl;
    return 1;
  }
  StoreResult r = store.storeFileStream(in);
  std::cout << r.fileHash << std::endl;
  std::cout << "size: " << r.totalSize << " bytes, chunks: " << r.chunkCount
            << ", new chunks: " << r.newChunks << std::endl;
  return 0;
}

static int get_command(ChunkStore &store, const std::string &hash,
                       const std::string &outPath) {
  bool found = false;
  {
    std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      std::cout << "Cannot create " << outPath << std::endl;
      return 1;
    }
    try {
      found = store.readFileTo(hash, out);
    } catch (const StoreError &) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(outPath, ec);
      throw;
    }
  }
  if (!found) {
    std::error_code ec;
    std::filesystem::remove(outPath, ec);
    std::cout << "File not found: " << hash << std::endl;
    return 1;
  }
  return 0;
}

static int rm_command(ChunkStore &store, const std::string &hash) {
  if (!store.fileExists(hash)) {
    std::cout << "File not found: " << hash << std::endl;
    return 1;
  }
  DeleteResult r = store.deleteFile(hash);
  std::cout << "deleted chunks: " << r.deletedChunks
            << ", remaining chunks: " << r.remainingChunks << std::endl;
  return 0;
}

static int info_command(ChunkStore &store, const std::string &hash) {
  auto info = store.getFileInfo(hash);
  if (!info) {
    std::cout << "File not found: " << hash << std::endl;
    return 1;
  }
  std::cout << "file:    " << info->fileHash << "\n"
            << "size:    " << info->totalSize << " bytes\n"
            << "chunks:  " << info->chunkCount << "\n"
            << "holders: " << info->holders << std::endl;
  std::cout << "Index\tOffset\tSize\tStored\tHash" << std::endl;
  for (const auto &c : info->chunks) {
    std::cout << c.index << '\t' << c.offset << '\t' << c.size << '\t'
              << c.storedSize << '\t' << c.hash << std::endl;
  }
  return 0;
}

static void publishStats(const StorageStats &s) {
  auto &metrics = MetricsRegistry::instance();
  metrics.setGauge("chunkvault_chunks", static_cast<double>(s.totalChunks));
  metrics.setGauge("chunkvault_chunk_refs", static_cast<double>(s.totalRefs));
  metrics.setGauge("chunkvault_files", static_cast<double>(s.totalFiles));
  metrics.setGauge("chunkvault_bytes", static_cast<double>(s.totalSize),
                   {{"kind", "raw"}});
  metrics.setGauge("chunkvault_bytes",
                   static_cast<double>(s.totalCompressedSize),
                   {{"kind", "stored"}});
  metrics.setGauge("chunkvault_compression_ratio", s.compressionRatio);
}

static int stats_command(ChunkStore &store, bool prometheus) {
  StorageStats s = store.getStorageStats();
  if (prometheus) {
    publishStats(s);
    std::cout << MetricsRegistry::instance().toPrometheus();
    return 0;
  }
  std::cout << "chunks:            " << s.totalChunks << "\n"
            << "chunk references:  " << s.totalRefs << "\n"
            << "files:             " << s.totalFiles << "\n"
            << "raw bytes:         " << s.totalSize << "\n"
            << "stored bytes:      " << s.totalCompressedSize << "\n"
            << std::fixed << std::setprecision(3)
            << "compression ratio: " << s.compressionRatio << "\n"
            << "chunks per file:   " << s.avgChunksPerFile << std::endl;
  return 0;
}

static int verify_command(ChunkStore &store, const std::string &hash) {
  auto report = store.verifyFile(hash);
  if (!report) {
    std::cout << "File not found: " << hash << std::endl;
    return 1;
  }
  for (const auto &issue : report->issues) {
    std::cout << "chunk " << issue.index << " (" << issue.hash
              << "): " << ChunkIssue::problemName(issue.problem) << ": "
              << issue.detail << std::endl;
  }
  std::cout << (report->ok() ? "Verification succeeded"
                             : "Verification FAILED")
            << " (" << report->chunksChecked << " chunks, "
            << report->bytesChecked << " bytes)" << std::endl;
  return report->ok() ? 0 : 2;
}

static int gc_command(ChunkStore &store, bool dryRun) {
  GCStats s = store.scanOrphanedChunks(dryRun);
  std::cout << "scanned: " << s.scannedFiles << ", orphaned: "
            << s.orphanedChunks << " (" << s.orphanedBytes << " bytes)"
            << ", removed: " << s.removedChunks << " (" << s.removedBytes
            << " bytes), stray: " << s.strayFiles
            << (dryRun ? " [dry run]" : "") << std::endl;
  return 0;
}

static int run(std::vector<std::string> args) {
  std::optional<std::string> configPath;
  if (args.size() >= 2 && args[0] == "--config") {
    configPath = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    usage();
    return 1;
  }

  try {
    RuntimeOptions opts = configPath ? loadRuntimeOptions(*configPath, true)
                                     : loadRuntimeOptions();
    initLogging(opts);

    const std::string &cmd = args[0];
    auto want = [&args](size_t n) { return args.size() == n + 1; };

    if (cmd == "put" && want(1)) {
      ChunkStore store(opts.store);
      return put_command(store, args[1]);
    } else if (cmd == "get" && want(2)) {
      ChunkStore store(opts.store);
      return get_command(store, args[1], args[2]);
    } else if (cmd == "rm" && want(1)) {
      ChunkStore store(opts.store);
      return rm_command(store, args[1]);
    } else if (cmd == "info" && want(1)) {
      ChunkStore store(opts.store);
      return info_command(store, args[1]);
    } else if (cmd == "stats" &&
               (want(0) || (want(1) && args[1] == "--prometheus"))) {
      ChunkStore store(opts.store);
      return stats_command(store, want(1));
    } else if (cmd == "verify" && want(1)) {
      ChunkStore store(opts.store);
      return verify_command(store, args[1]);
    } else if (cmd == "gc" && (want(0) || (want(1) && args[1] == "--dry-run"))) {
      ChunkStore store(opts.store);
      return gc_command(store, want(1));
    }
  } catch (const StoreError &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "chunkvault_ctl failed: " + std::string(e.what()));
    std::cerr << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "chunkvault_ctl failed: " + std::string(e.what()));
    std::cerr << "error: " << e.what() << std::endl;
    return 2;
  }

  std::cout << "Unknown command" << std::endl;
  usage();
  return 1;
}

int main(int argc, char **argv) {
  int rc = run(std::vector<std::string>(argv + 1, argv + argc));
  Logger::shutdown();
  return rc;
}
