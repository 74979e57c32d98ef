#ifndef FLUX_TRANSFER_NOTIFICATION_SINK_HPP
#define FLUX_TRANSFER_NOTIFICATION_SINK_HPP

#include <functional>
#include <string>

namespace flux {
namespace transfer {

// Receives (transfer_id, progress percent, message) on the thread driving the
// transfer. Implementations must be thread-safe and must not block for long.
using NotificationSink = std::function<void(const std::string&, int, const std::string&)>;

} // namespace transfer
} // namespace flux

#endif // FLUX_TRANSFER_NOTIFICATION_SINK_HPP
