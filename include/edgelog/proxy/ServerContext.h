#pragma once

#include "edgelog/query/QueryService.h"
#include "edgelog/route/RouteTable.h"
#include "edgelog/store/ConnectionRecorder.h"

#include <cstddef>
#include <string>

namespace edgelog {
namespace proxy {

// Shared handles for the proxy and its handlers. The pointees are owned by the
// caller and must outlive the server.
struct ServerContext {
    const route::RouteTable* routes{nullptr};
    store::ConnectionRecorder* recorder{nullptr};
    const query::QueryService* queries{nullptr};

    std::string apiPrefix{"/_proxy"};
    std::string dashboardFile;

    // Relay pauses reading from one side while the other side's output buffer
    // is above this.
    size_t highWaterMarkBytes{8 * 1024 * 1024};
};

} // namespace proxy
} // namespace edgelog
