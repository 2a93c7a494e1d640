#pragma once

#include <string>
#include <vector>

#include <epsim_core/Types.hpp>
#include <epsim_env/Observation.hpp>

namespace epsim {

/**
 * @brief Robot controlled through the environment. Created by TaskHooks::loadAgent on every reconfigure, its
 * bodies live in the scene.
 */
class Agent {
   public:
    virtual ~Agent() = default;

    /**
     * @brief Proprioceptive observation, e.g. joint positions and velocities
     *
     * @return ObservationDict : record placed under the "agent" key
     */
    virtual ObservationDict getProprioception() const = 0;

    /** Actor ids of all robot links, used to mask actor segmentation */
    virtual std::vector<int> getRobotLinkIds() const = 0;

    /** Expected action size under the current control mode */
    virtual long getActionSize() const = 0;

    virtual std::string getControlMode() const = 0;
    virtual std::vector<std::string> getSupportedControlModes() const = 0;
    virtual void setControlMode(const std::string &controlMode) = 0;

    /**
     * @brief Store a new action, applied during the following simulation steps
     *
     * @param action : action of size getActionSize()
     */
    virtual void setAction(const vector_t &action) = 0;

    /** Called before every physics substep */
    virtual void beforeSimulationStep() {}
};

}  // namespace epsim
