#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "transfer/transfer_engine.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  std::string mode;
  std::string address;
  std::string file;
  std::string directory;
  std::string password;
  std::string code;
  std::string log_file{"flux.log"};
  std::string log_level{"info"};
  uint16_t port{flux::transfer::TransferConfig::DEFAULT_PORT};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage:\n"
            << "  " << program_name << " send -a <address> -f <file> [-p <port>] [-k <password>] [-l <log>]\n"
            << "  " << program_name << " receive -d <dir> [-p <port>] [-k <password>] [-c <code>] [-l <log>]\n"
            << "Arguments:\n"
            << "  -a, --address   Receiver address (send)\n"
            << "  -f, --file      File to send (send)\n"
            << "  -d, --dir       Directory for received files (receive)\n"
            << "  -p, --port      Service port (default 5555)\n"
            << "  -k, --password  Shared password, enables encryption\n"
            << "  -c, --code      Only accept transfers carrying this code (receive)\n"
            << "  -l, --log       Log file (default flux.log)\n"
            << "  -v, --verbosity Log level: trace, debug, info, warning, error\n"
            << "Example: " << program_name << " send -a 192.168.1.20 -f report.pdf -k secret\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  if (argc < 2) {
    print_usage(argv[0]);
    return options;
  }

  options.mode = argv[1];
  if (options.mode != "send" && options.mode != "receive") {
    std::cerr << "Error: Unknown mode: " << options.mode << '\n';
    print_usage(argv[0]);
    return options;
  }

  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-a", &options.address},   {"--address", &options.address},
    {"-f", &options.file},      {"--file", &options.file},
    {"-d", &options.directory}, {"--dir", &options.directory},
    {"-k", &options.password},  {"--password", &options.password},
    {"-c", &options.code},      {"--code", &options.code},
    {"-l", &options.log_file},  {"--log", &options.log_file},
    {"-v", &options.log_level}, {"--verbosity", &options.log_level},
    {"-p", nullptr},            {"--port", nullptr}
  };

  if ((argc - 2) % 2 != 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 2; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (it->second) {
      *it->second = value;
    } else {
      try {
        int port = std::stoi(value);
        if (port <= 0 || port > 65535) {
          throw std::out_of_range(value);
        }
        options.port = static_cast<uint16_t>(port);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid port number\n";
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.mode == "send" && (options.address.empty() || options.file.empty())) {
    std::cerr << "Error: send requires an address and a file\n";
    print_usage(argv[0]);
    return options;
  }
  if (options.mode == "receive" && options.directory.empty()) {
    std::cerr << "Error: receive requires a directory\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

flux::transfer::NotificationSink make_console_sink() {
  auto mutex = std::make_shared<std::mutex>();
  return [mutex](const std::string& transfer_id, int progress, const std::string& message) {
    std::lock_guard<std::mutex> lock(*mutex);
    std::cout << "[" << transfer_id.substr(0, 8) << "] " << progress << "% " << message << std::endl;
  };
}

bool run_send(const ProgramOptions& options) {
  flux::transfer::TransferConfig config;
  flux::transfer::TransferRegistry registry(config.code_ttl);
  flux::transfer::TransferEngine engine(config, registry, make_console_sink());

  const auto transfer_id = engine.send_file(options.file, options.address, options.port, options.password);
  const auto record = registry.get(transfer_id);
  if (!record || record->status != flux::transfer::TransferStatus::COMPLETED) {
    std::cerr << "Error: Transfer failed: " << (record ? record->error_message : "unknown transfer") << '\n';
    return false;
  }

  std::cout << "Sent " << record->file_name << " (" << record->original_size << " bytes)\n";
  return true;
}

bool run_receive(const ProgramOptions& options) {
  flux::transfer::TransferConfig config;
  config.port = options.port;
  config.save_directory = options.directory;
  config.password = options.password;
  config.expected_code = options.code;

  flux::transfer::TransferRegistry registry(config.code_ttl);
  flux::transfer::TransferEngine engine(config, registry, make_console_sink());

  if (!engine.start_receiver()) {
    std::cerr << "Error: Failed to start receiver on port " << options.port << '\n';
    return false;
  }
  std::cout << "Receiving into " << options.directory << " on port " << engine.get_receiver_port()
            << (options.password.empty() ? "" : " (encrypted)") << '\n';

  flux::cli::CLI cli(engine, registry);
  cli.run();

  engine.shutdown();
  return true;
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    flux::logger::init_logging(options.log_file, flux::logger::parse_severity(options.log_level));

    bool success = options.mode == "send" ? run_send(options) : run_receive(options);
    return success ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
