#pragma once

#include <vector>

#include <epsim_core/Types.hpp>
#include <epsim_engine/Engine.hpp>

namespace epsim {

/** Size of a rigid body state: position (3), wxyz quaternion (4), linear velocity (3), angular velocity (3) */
constexpr long KINEMATIC_DIM = 13;

/**
 * @brief Ordered bodies of a scene, captured once per reconfigure
 */
struct SceneSnapshot {
    std::vector<engine::Actor *> actors;
    std::vector<engine::Articulation *> articulations;

    /** Degrees of freedom of each articulation at capture time */
    std::vector<long> dofs;

    static SceneSnapshot capture(const engine::Scene &scene);

    void clear();
};

/** Rigid body state of an actor, size KINEMATIC_DIM */
vector_t getActorState(const engine::Actor &actor);
void setActorState(engine::Actor &actor, const vector_t &state);

/** Root state followed by joint positions and joint velocities, size KINEMATIC_DIM + 2 * dof */
vector_t getArticulationState(const engine::Articulation &articulation);
void setArticulationState(engine::Articulation &articulation, const vector_t &state);

/**
 * @brief Serializes the kinematic state of the captured bodies to a flat vector and back. The layout is fixed by the
 * snapshot: all actors first, then all articulations, each in snapshot order.
 */
class StateCodec {
   public:
    /**
     * @brief Fix the state layout
     *
     * @param snapshot : bodies to serialize
     * @param scene : scene owning the bodies, checked for structural changes before every encode and decode
     */
    void capture(const SceneSnapshot &snapshot, const engine::Scene &scene);

    /** Drop the captured layout, encode and decode throw until the next capture */
    void invalidate();

    bool isCaptured() const { return scene_ != nullptr; }

    vector_t encode() const;

    /** Apply a state vector, throws ShapeMismatchError unless its size is exactly getStateSize() */
    void decode(const vector_t &state) const;

    /** 13 * |actors| + sum(13 + 2 * dof) over the captured articulations */
    long getStateSize() const;

   private:
    void checkLayout() const;

    SceneSnapshot snapshot_;
    const engine::Scene *scene_ = nullptr;
};

}  // namespace epsim
