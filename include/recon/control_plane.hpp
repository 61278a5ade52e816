/**
 * @file control_plane.hpp
 * @brief Abstract lifecycle control API consumed by the reconciler.
 *
 * A not-found answer on Fetch / FetchState is a normal result (absent
 * instance / empty network state), never an error. Every other failure is
 * returned as an Error of kind kTransport or kApi.
 */

#ifndef RECON_CONTROL_PLANE_HPP_
#define RECON_CONTROL_PLANE_HPP_

#include "recon/instance.hpp"
#include "recon/vocabulary.hpp"

#include <string>

namespace recon {

class ControlPlane {
 public:
  virtual ~ControlPlane() = default;

  /** Current status and metadata; status kAbsent when not found. */
  virtual Result<ObservedInstance> Fetch(const std::string& name) = 0;

  /** Per-device addresses; empty when the instance is not found. */
  virtual Result<NetworkState> FetchState(const std::string& name) = 0;

  /**
   * @param body    Creation body (see CreationBody()).
   * @param target  Placement node, empty for no preference.
   */
  virtual Status Create(const Json& body, const std::string& target) = 0;

  virtual Status SetState(const std::string& name, StateAction action,
                          uint32_t timeout_s, bool force) = 0;

  virtual Status Delete(const std::string& name) = 0;

  /** Replace the instance's mutable attributes with @p body. */
  virtual Status Update(const std::string& name, const Json& body) = 0;

  virtual Status Authenticate(const std::string& secret) = 0;

  /** Recorded request/response pairs (debug mode), JSON array. */
  virtual Json DebugLogs() const { return Json::array(); }
};

}  // namespace recon

#endif  // RECON_CONTROL_PLANE_HPP_
