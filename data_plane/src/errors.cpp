#include "skyhop/errors.hpp"

#include <sstream>

namespace skyhop {

namespace {

std::string describe_unreachable(const std::vector<RegionPair> &pairs) {
    std::ostringstream oss;
    oss << "no feasible transfer plan; unreachable pairs:";
    for (const auto &pair : pairs) {
        oss << ' ' << pair.source << "->" << pair.destination;
    }
    return oss.str();
}

std::string describe_abort(JobId job, const std::string &reason, const std::vector<FailedChunk> &failed) {
    std::ostringstream oss;
    oss << "job " << job << " aborted: " << reason;
    for (const auto &chunk : failed) {
        oss << "\n  chunk " << chunk.id << " key=" << chunk.source_key << " offset=" << chunk.offset
            << " attempts=" << chunk.attempts;
        if (!chunk.error.empty()) {
            oss << " error=" << chunk.error;
        }
    }
    return oss.str();
}

} // namespace

PlanningInfeasible::PlanningInfeasible(std::vector<RegionPair> unreachable)
    : Error(describe_unreachable(unreachable)), unreachable_(std::move(unreachable)) {}

ProvisioningFailure::ProvisioningFailure(RegionTag region, const std::string &reason)
    : Error("cannot provision gateway in " + region + ": " + reason), region_(std::move(region)) {}

GatewayUnreachable::GatewayUnreachable(GatewayId gateway)
    : Error("gateway " + std::to_string(gateway) + " missed its liveness deadline"), gateway_(gateway) {}

JobAborted::JobAborted(JobId job, const std::string &reason, std::vector<FailedChunk> failed)
    : Error(describe_abort(job, reason, failed)), job_(job), reason_(reason), failed_(std::move(failed)) {}

} // namespace skyhop
