#pragma once

#include <iostream>
#include <string>
#include "transfer/transfer_engine.hpp"
#include "transfer/transfer_registry.hpp"

namespace flux {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(transfer::TransferEngine& engine, transfer::TransferRegistry& registry,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    transfer::TransferEngine& engine_;
    transfer::TransferRegistry& registry_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument, const std::string& target);
    void handle_status_command();
    void handle_send_command(const std::string& filename, const std::string& target);
    void handle_cancel_command(const std::string& transfer_id);
    void handle_code_command(const std::string& code);
    void handle_help_command();
    void print_record(const transfer::TransferRecord& record);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace flux
