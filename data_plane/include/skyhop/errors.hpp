#pragma once

#include "skyhop/types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace skyhop {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

class ConfigError : public Error {
  public:
    using Error::Error;
};

struct RegionPair {
    RegionTag source;
    RegionTag destination;
};

class PlanningInfeasible : public Error {
  public:
    explicit PlanningInfeasible(std::vector<RegionPair> unreachable);

    const std::vector<RegionPair> &unreachable() const noexcept { return unreachable_; }

  private:
    std::vector<RegionPair> unreachable_;
};

class ProvisioningFailure : public Error {
  public:
    ProvisioningFailure(RegionTag region, const std::string &reason);

    const RegionTag &region() const noexcept { return region_; }

  private:
    RegionTag region_;
};

class ObjectStoreError : public Error {
  public:
    ObjectStoreError(const std::string &msg, bool transient) : Error(msg), transient_(transient) {}

    bool transient() const noexcept { return transient_; }

  private:
    bool transient_;
};

class ConnectionError : public Error {
  public:
    using Error::Error;
};

class ProtocolError : public Error {
  public:
    using Error::Error;
};

class ChunkTransferError : public Error {
  public:
    ChunkTransferError(const std::string &msg, bool transient) : Error(msg), transient_(transient) {}

    bool transient() const noexcept { return transient_; }

  private:
    bool transient_;
};

class GatewayUnreachable : public Error {
  public:
    explicit GatewayUnreachable(GatewayId gateway);

    GatewayId gateway() const noexcept { return gateway_; }

  private:
    GatewayId gateway_;
};

struct FailedChunk {
    ChunkId id;
    std::string source_key;
    std::string destination_key;
    std::uint64_t offset;
    std::uint32_t attempts;
    std::string error;
};

class JobAborted : public Error {
  public:
    JobAborted(JobId job, const std::string &reason, std::vector<FailedChunk> failed);

    JobId job() const noexcept { return job_; }
    const std::string &reason() const noexcept { return reason_; }
    const std::vector<FailedChunk> &failed_chunks() const noexcept { return failed_; }

  private:
    JobId job_;
    std::string reason_;
    std::vector<FailedChunk> failed_;
};

} // namespace skyhop
