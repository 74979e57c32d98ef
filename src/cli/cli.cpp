#include "cli/cli.hpp"
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace flux {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(transfer::TransferEngine& engine, transfer::TransferRegistry& registry,
         std::istream& input, std::ostream& output)
  : running_(false)
  , engine_(engine)
  , registry_(registry)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "flux> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command, argument, target;
    iss >> command >> argument >> target;

    if (command == "quit" || command == "exit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, argument, target);
    }

    if (running_) {
      output_ << "flux> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument, const std::string& target) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " " << argument << " " << target;

  if (command == "status" && argument.empty()) {
    handle_status_command();
  }
  else if (command == "help" && argument.empty()) {
    handle_help_command();
  }
  else if (command == "send" && !argument.empty() && !target.empty()) {
    handle_send_command(argument, target);
  }
  else if (command == "cancel" && !argument.empty()) {
    handle_cancel_command(argument);
  }
  else if (command == "code" && !argument.empty()) {
    handle_code_command(argument);
  }
  else {
    output_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  }
}

void CLI::handle_status_command() {
  const auto records = registry_.list();
  if (records.empty()) {
    output_ << "No transfers" << std::endl;
    return;
  }
  for (const auto& record : records) {
    print_record(record);
  }
}

void CLI::handle_send_command(const std::string& filename, const std::string& target) {
  std::string address = target;
  uint16_t port = transfer::TransferConfig::DEFAULT_PORT;

  size_t colon_pos = target.rfind(':');
  if (colon_pos != std::string::npos) {
    address = target.substr(0, colon_pos);
    const std::string port_str = target.substr(colon_pos + 1);
    try {
      int value = std::stoi(port_str);
      if (value <= 0 || value > 65535) {
        throw std::out_of_range(port_str);
      }
      port = static_cast<uint16_t>(value);
    } catch (const std::exception&) {
      output_ << "Invalid port number: " << port_str << std::endl;
      return;
    }
  }

  try {
    const auto transfer_id = engine_.send_file_async(filename, address, port, engine_.get_config().password);
    output_ << "Started transfer " << transfer_id << " of " << filename
            << " to " << address << ":" << port << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error starting transfer", e.what());
  }
}

void CLI::handle_cancel_command(const std::string& transfer_id) {
  if (engine_.cancel_transfer(transfer_id)) {
    output_ << "Cancellation requested for " << transfer_id << std::endl;
  } else {
    output_ << "No active transfer " << transfer_id << std::endl;
  }
}

void CLI::handle_code_command(const std::string& code) {
  auto record = registry_.get_transfer_by_code(code);
  if (!record) {
    output_ << "Unknown or expired code: " << code << std::endl;
    return;
  }
  print_record(*record);
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                        Display this help message" << std::endl;
  output_ << "  status                      List all transfers" << std::endl;
  output_ << "  send <file> <host[:port]>   Send <file> to a receiver" << std::endl;
  output_ << "  cancel <transfer_id>        Cancel an active transfer" << std::endl;
  output_ << "  code <code>                 Show the transfer bound to a 6-digit code" << std::endl;
  output_ << "  quit                        Exit the flux shell" << std::endl << std::endl;
}

void CLI::print_record(const transfer::TransferRecord& record) {
  output_ << record.id << "  " << std::setw(7) << std::left << transfer::direction_to_string(record.direction)
          << std::setw(10) << transfer::status_to_string(record.status) << std::right
          << std::setw(3) << record.progress << "%  " << record.file_name;
  if (!record.transfer_code.empty()) {
    output_ << "  code " << record.transfer_code;
  }
  if (record.status == transfer::TransferStatus::FAILED) {
    output_ << "  (" << record.error_message << ")";
  } else if (!record.file_path.empty() && record.direction == transfer::TransferDirection::RECEIVE) {
    output_ << "  -> " << record.file_path;
  }
  output_ << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace flux
