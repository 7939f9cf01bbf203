/**
 * @file events.cpp
 * @brief JSON rendering of observations
 *
 * @date 2025
 */

#include "runbox/runtime/events.hpp"

using json = nlohmann::json;

namespace runbox {
namespace runtime {

namespace {

struct ObservationJson {
    json operator()(const CmdOutputObservation& o) const {
        return {
            {"observation", "run"},
            {"content", o.content},
            {"command_id", o.command_id},
            {"command", o.command},
            {"exit_code", o.exit_code}
        };
    }

    json operator()(const FileReadObservation& o) const {
        return {{"observation", "read"}, {"content", o.content}, {"path", o.path}};
    }

    json operator()(const FileWriteObservation& o) const {
        return {{"observation", "write"}, {"content", o.content}, {"path", o.path}};
    }

    json operator()(const ErrorObservation& o) const {
        return {{"observation", "error"}, {"content", o.content}};
    }
};

} // namespace

json ToJson(const Observation& observation) {
    return std::visit(ObservationJson{}, observation);
}

} // namespace runtime
} // namespace runbox
