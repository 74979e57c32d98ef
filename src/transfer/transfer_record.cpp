#include "transfer/transfer_record.hpp"

namespace flux {
namespace transfer {

const char* status_to_string(TransferStatus status) {
  switch (status) {
    case TransferStatus::CONNECTING: return "connecting";
    case TransferStatus::SENDING: return "sending";
    case TransferStatus::RECEIVING: return "receiving";
    case TransferStatus::COMPLETED: return "completed";
    case TransferStatus::FAILED: return "failed";
    default: return "unknown";
  }
}

const char* direction_to_string(TransferDirection direction) {
  switch (direction) {
    case TransferDirection::SEND: return "send";
    case TransferDirection::RECEIVE: return "receive";
    default: return "unknown";
  }
}

} // namespace transfer
} // namespace flux
