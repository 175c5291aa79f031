/**
 * TrackerClient - one request/response exchange per call.
 *
 * The request is not length-prefixed: closing the send side tells the
 * tracker it is complete, and the tracker closing its side ends the reply.
 */

#include "tracker/tracker_client.h"

#include "common/discovery_error.h"

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

TrackerClient::TrackerClient(Transport& transport, ClientOptions options)
    : transport_(transport), options_(std::move(options)) {}

void TrackerClient::announce(const PeerId& tracker, const Announce& request) const {
    spdlog::debug("announce to {}: host {} ({} items, {})",
                  tracker.short_string(), request.host.short_string(),
                  request.content.size(), to_string(request.kind));

    // The tracker's reply carries nothing for announces.
    exchange(tracker, request);
}

QueryResponse TrackerClient::query(const PeerId& tracker, const Query& request) const {
    spdlog::debug("query {} for {} (complete={}, verified={})",
                  tracker.short_string(), request.content.to_string(),
                  request.flags.complete, request.flags.verified);

    auto bytes = exchange(tracker, request);
    Response response = decode_response(bytes);

    auto* result = std::get_if<QueryResponse>(&response);
    if (result == nullptr) {
        throw DiscoveryError(ErrorKind::Decoding,
                             "tracker answered a query with response variant " +
                             std::to_string(response.index()));
    }
    spdlog::debug("tracker {} returned {} hosts", tracker.short_string(), result->hosts.size());
    return std::move(*result);
}

std::vector<uint8_t> TrackerClient::exchange(const PeerId& tracker, const Request& request) const {
    auto payload = encode_request(request);

    try {
        auto connection = transport_.connect(tracker, options_.protocol);
        auto stream = connection->open_bi();

        stream->write_all(payload);
        stream->finish();
        spdlog::debug("sent {} request bytes to {}", payload.size(), tracker.short_string());

        auto response = stream->read_to_end(options_.response_limit);
        spdlog::debug("received {} response bytes from {}", response.size(), tracker.short_string());
        return response;
    } catch (const DiscoveryError& e) {
        spdlog::warn("exchange with tracker {} failed ({}): {}",
                     tracker.short_string(), to_string(e.kind()), e.what());
        throw;
    } catch (const std::system_error& e) {
        spdlog::warn("exchange with tracker {} failed: {}", tracker.short_string(), e.what());
        throw DiscoveryError(ErrorKind::Connection, e.what());
    }
}
