#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/reader_config.hpp"
#include "document/document.hpp"
#include "document/document_parser.hpp"
#include "errors.hpp"
#include "runtime/frame_driver.hpp"
#include "runtime/reader.hpp"
#include "runtime/upload_mailbox.hpp"

namespace {

void usage(const char* prog) {
  std::cerr
      << "Usage:\n"
      << "  " << prog << " --input FILE [options]\n\n"
      << "Required:\n"
      << "  --input  FILE   Text document to read (form feed separates pages)\n\n"
      << "Options:\n"
      << "  --config FILE   YAML config file (see configs/)\n"
      << "  --wpm    N      Words per minute (overrides config)\n"
      << "  --chunk  N      Words shown together (overrides config)\n"
      << "  --fps    N      Simulated frame rate (overrides config)\n"
      << "  --frames N      Stop after N frames (default: run to end of document)\n"
      << "  --realtime      Sleep one frame period per frame\n"
      << "  --log           Print per-frame logging (page, word index)\n"
      << "  --list-configs  List available YAML configs in configs/\n"
      << "  -h, --help      Show this help message\n\n"
      << "Examples:\n"
      << "  " << prog << " --input tests/data/two_pages.txt\n"
      << "  " << prog << " --input book.txt --config configs/skim_reader.yaml --realtime\n";
}

std::vector<std::uint8_t> read_file_bytes(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    throw std::runtime_error("cannot open file: " + path);
  }
  return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(f)),
                                   std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string input_file;
  std::string config_file;
  double wpm = -1.0;      // -1 means "from config"
  int chunk = -1;
  double fps = -1.0;
  long long max_frames = -1;  // -1 means "until end of document"
  bool realtime = false;
  bool log = false;

  // --- Parse arguments ---
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    }
    if (arg == "--list-configs") {
      std::cout << "Available YAML configs in configs/:\n";
      auto files = rsvp_reader::list_config_files("configs");
      if (files.empty()) {
        std::cout << "  (none found)\n";
      } else {
        for (const auto& f : files) {
          std::cout << "  " << f << "\n";
        }
      }
      return 0;
    }
    if (arg == "--input") {
      if (i + 1 >= argc) { std::cerr << "--input requires a file path\n"; return 2; }
      input_file = argv[++i];
      continue;
    }
    if (arg == "--config") {
      if (i + 1 >= argc) { std::cerr << "--config requires a file path\n"; return 2; }
      config_file = argv[++i];
      continue;
    }
    if (arg == "--wpm") {
      if (i + 1 >= argc) { std::cerr << "--wpm requires a number\n"; return 2; }
      wpm = std::atof(argv[++i]);
      continue;
    }
    if (arg == "--chunk") {
      if (i + 1 >= argc) { std::cerr << "--chunk requires a number\n"; return 2; }
      chunk = std::atoi(argv[++i]);
      continue;
    }
    if (arg == "--fps") {
      if (i + 1 >= argc) { std::cerr << "--fps requires a number\n"; return 2; }
      fps = std::atof(argv[++i]);
      continue;
    }
    if (arg == "--frames") {
      if (i + 1 >= argc) { std::cerr << "--frames requires a number\n"; return 2; }
      max_frames = std::atoll(argv[++i]);
      continue;
    }
    if (arg == "--realtime") { realtime = true; continue; }
    if (arg == "--log") { log = true; continue; }

    std::cerr << "Unknown argument: " << arg << "\n";
    usage(argv[0]);
    return 2;
  }

  if (input_file.empty()) {
    std::cerr << "Error: --input is required.\n\n";
    usage(argv[0]);
    return 2;
  }

  // --- Load configuration ---
  rsvp_reader::ReaderConfig cfg;
  try {
    if (!config_file.empty()) {
      cfg = rsvp_reader::load_reader_config(config_file);
    }
    if (wpm >= 0.0) cfg.pacing.words_per_minute = wpm;
    if (chunk >= 0) cfg.pacing.chunk_size = chunk;
    if (fps >= 0.0) cfg.fps = fps;
    cfg.validate();
  } catch (const rsvp_reader::ConfigError& e) {
    std::cerr << "Error loading config: " << e.what() << "\n";
    return 1;
  }
  log = log || cfg.log_chunks;

  // --- Compose the engine ---
  rsvp_reader::Reader reader(rsvp_reader::Document::placeholder(cfg.placeholder_text), cfg.pacing);
  rsvp_reader::UploadMailbox mailbox;
  rsvp_reader::PlainTextParser parser;
  rsvp_reader::FrameDriver driver(reader, mailbox, parser);
  driver.set_log(log);

  std::cout << "Config:  " << (config_file.empty() ? "<defaults>" : config_file) << "\n";
  std::cout << "Pacing:  " << cfg.pacing.words_per_minute << " wpm, chunk="
            << cfg.pacing.chunk_size << " (" << rsvp_reader::to_string(cfg.pacing.catch_up)
            << "), interval=" << reader.interval().count() << "s\n";
  std::cout << "Input:   " << input_file << "\n\n";

  // The upload arrives from another thread while frames are already running
  // on the placeholder, the way a file picker would hand it over.
  std::atomic<bool> upload_done{false};
  std::string upload_error;
  std::thread producer([&mailbox, &input_file, &upload_error, &upload_done]() {
    try {
      mailbox.post(read_file_bytes(input_file));
    } catch (const std::exception& e) {
      upload_error = e.what();
    }
    upload_done = true;
  });

  // --- Frame loop ---
  const auto frame_period = rsvp_reader::PacingClock::Seconds(1.0 / cfg.fps);
  int exit_code = 0;
  bool reading = false;
  long long chunks = 0;
  while (max_frames < 0 || driver.frame_count() < max_frames) {
    if (realtime) {
      std::this_thread::sleep_for(
          std::chrono::duration_cast<std::chrono::steady_clock::duration>(frame_period));
    }
    // Sampled before the frame: a finished producer's upload is taken by it.
    const bool upload_was_done = upload_done;
    auto shown = driver.frame(frame_period);

    if (!reading) {
      const auto status = driver.last_ingest_status();
      if (status == rsvp_reader::IngestStatus::Ingested) {
        reading = true;
        std::cout << driver.last_ingest_message() << "\n\n";
      } else if (status != rsvp_reader::IngestStatus::None) {
        std::cerr << "Error: nothing to read in " << input_file << " ("
                  << driver.last_ingest_message() << ")\n";
        exit_code = 1;
        break;
      } else if (upload_was_done) {
        std::cerr << "Error loading input: " << upload_error << "\n";
        exit_code = 1;
        break;
      }
    }

    if (shown) {
      ++chunks;
      if (!log) {
        std::cout << "[page " << (shown->page_index + 1) << "/" << reader.page_count() << "] "
                  << shown->text << "\n";
      }
    }
    if (reading && !reader.is_playing()) break;
  }
  producer.join();
  if (exit_code != 0) return exit_code;

  std::cout << "\nDone. " << chunks << " chunks shown in " << driver.frame_count()
            << " frames (" << (static_cast<double>(driver.frame_count()) / cfg.fps) << "s).\n";
  return 0;
}
