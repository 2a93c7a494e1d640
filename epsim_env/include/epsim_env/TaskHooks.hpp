#pragma once

#include <map>
#include <memory>
#include <random>
#include <string>

#include <epsim_core/Types.hpp>
#include <epsim_engine/Engine.hpp>
#include <epsim_env/Action.hpp>
#include <epsim_env/Agent.hpp>
#include <epsim_env/Observation.hpp>
#include <epsim_sensors/CameraConfig.hpp>

namespace epsim {

/** Outcome of a task evaluation */
struct EvaluationInfo {
    bool success = false;

    /** Additional task metrics, e.g. distance to goal */
    std::map<std::string, scalar_t> metrics;
};

/**
 * @brief Extension points of a concrete task. Every hook is a no-op by default, except evaluate and
 * computeDenseReward, which throw UnimplementedHookError unless overridden.
 *
 * Hooks receiving an rng must use it as their only source of randomness.
 */
class TaskHooks {
   public:
    virtual ~TaskHooks() = default;

    /** Create the agent in a freshly created scene. nullptr for a simulation without agent. */
    virtual std::unique_ptr<Agent> loadAgent(engine::Scene &scene, std::mt19937 &rng) { return nullptr; }

    /** Create static, kinematic and dynamic task actors */
    virtual void loadActors(engine::Scene &scene, std::mt19937 &rng) {}

    /** Create task articulations */
    virtual void loadArticulations(engine::Scene &scene, std::mt19937 &rng) {}

    /** Scene cameras of the task */
    virtual sensors::CameraConfigs getCameraConfigs() const { return {}; }

    /** Cameras mounted on the agent, they replace task cameras with the same uuid */
    virtual sensors::CameraConfigs getAgentCameraConfigs() const { return {}; }

    /** Initialize the poses of actors */
    virtual void initializeActors(std::mt19937 &rng) {}

    /** Initialize the (joint) poses of articulations */
    virtual void initializeArticulations(std::mt19937 &rng) {}

    /** Initialize the (joint) poses of the agent, agent is nullptr without agent */
    virtual void initializeAgent(Agent *agent, std::mt19937 &rng) {}

    /** Initialize task-relevant information, like goals */
    virtual void initializeTask(std::mt19937 &rng) {}

    /** Evaluate whether the task succeeds */
    virtual EvaluationInfo evaluate(const Observation &observation);

    virtual scalar_t computeDenseReward(const Observation &observation, const ActionCommand &action,
                                        const EvaluationInfo &info);

    /** Task-relevant observations placed under the "extra" key */
    virtual ObservationDict getExtraObservation() const { return {}; }

    virtual void beforeControlStep() {}
    virtual void afterSimulationStep() {}

    /** Task state appended to the simulation state, e.g. the goal position */
    virtual vector_t getTaskState() const { return vector_t(0); }

    /** Restore the task state, default accepts an empty state only */
    virtual void setTaskState(const vector_t &state);
};

}  // namespace epsim
