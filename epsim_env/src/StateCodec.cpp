#include <algorithm>

#include <epsim_core/Rotations.hpp>
#include <epsim_core/Throws.hpp>
#include <epsim_env/StateCodec.hpp>

namespace epsim {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
SceneSnapshot SceneSnapshot::capture(const engine::Scene &scene) {
    SceneSnapshot snapshot;
    snapshot.actors = scene.getAllActors();
    snapshot.articulations = scene.getAllArticulations();
    for (const auto *articulation : snapshot.articulations) {
        snapshot.dofs.push_back(articulation->getDof());
    }
    return snapshot;
}

void SceneSnapshot::clear() {
    actors.clear();
    articulations.clear();
    dofs.clear();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
static vector_t rigidBodyState(const engine::Pose &pose, const vector3_t &velocity, const vector3_t &angularVelocity) {
    vector_t state(KINEMATIC_DIM);
    state << pose.position, quat2wxyz(pose.orientation), velocity, angularVelocity;
    return state;
}

static engine::Pose rigidBodyPose(const vector_t &state) {
    engine::Pose pose;
    pose.position = state.segment<3>(0);
    pose.orientation = wxyz2quat(state.segment<4>(3));
    return pose;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
vector_t getActorState(const engine::Actor &actor) {
    return rigidBodyState(actor.getPose(), actor.getVelocity(), actor.getAngularVelocity());
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void setActorState(engine::Actor &actor, const vector_t &state) {
    if (state.size() != KINEMATIC_DIM) {
        EPSIM_THROW_AS(ShapeMismatchError, "Actor {} state must have size {}, got {}", actor.getName(),
                       KINEMATIC_DIM, state.size());
    }
    actor.setPose(rigidBodyPose(state));
    actor.setVelocity(state.segment<3>(7));
    actor.setAngularVelocity(state.segment<3>(10));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
vector_t getArticulationState(const engine::Articulation &articulation) {
    const long dof = articulation.getDof();
    vector_t state(KINEMATIC_DIM + 2 * dof);
    state << rigidBodyState(articulation.getRootPose(), articulation.getRootVelocity(),
                            articulation.getRootAngularVelocity()),
        articulation.getQpos(), articulation.getQvel();
    return state;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void setArticulationState(engine::Articulation &articulation, const vector_t &state) {
    const long dof = articulation.getDof();
    if (state.size() != KINEMATIC_DIM + 2 * dof) {
        EPSIM_THROW_AS(ShapeMismatchError, "Articulation {} state must have size {}, got {}", articulation.getName(),
                       KINEMATIC_DIM + 2 * dof, state.size());
    }
    articulation.setRootPose(rigidBodyPose(state));
    articulation.setRootVelocity(state.segment<3>(7));
    articulation.setRootAngularVelocity(state.segment<3>(10));
    articulation.setQpos(state.segment(KINEMATIC_DIM, dof));
    articulation.setQvel(state.segment(KINEMATIC_DIM + dof, dof));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void StateCodec::capture(const SceneSnapshot &snapshot, const engine::Scene &scene) {
    snapshot_ = snapshot;
    scene_ = &scene;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void StateCodec::invalidate() {
    snapshot_.clear();
    scene_ = nullptr;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
long StateCodec::getStateSize() const {
    long size = KINEMATIC_DIM * static_cast<long>(snapshot_.actors.size());
    for (auto dof : snapshot_.dofs) {
        size += KINEMATIC_DIM + 2 * dof;
    }
    return size;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void StateCodec::checkLayout() const {
    if (scene_ == nullptr) {
        EPSIM_THROW_AS(ShapeMismatchError, "No state layout captured, reconfigure the environment first");
    }

    const auto actors = scene_->getAllActors();
    const auto articulations = scene_->getAllArticulations();
    if (actors.size() != snapshot_.actors.size() || articulations.size() != snapshot_.articulations.size()) {
        EPSIM_THROW_AS(ShapeMismatchError,
                       "Scene changed since the state layout was captured: {} actors and {} articulations, "
                       "captured {} and {}",
                       actors.size(), articulations.size(), snapshot_.actors.size(), snapshot_.articulations.size());
    }
    for (const auto *actor : snapshot_.actors) {
        if (std::find(actors.begin(), actors.end(), actor) == actors.end()) {
            EPSIM_THROW_AS(ShapeMismatchError, "Captured actor is no longer part of the scene");
        }
    }
    for (size_t i = 0; i < snapshot_.articulations.size(); ++i) {
        const auto *articulation = snapshot_.articulations[i];
        if (std::find(articulations.begin(), articulations.end(), articulation) == articulations.end()) {
            EPSIM_THROW_AS(ShapeMismatchError, "Captured articulation is no longer part of the scene");
        }
        if (articulation->getDof() != snapshot_.dofs[i]) {
            EPSIM_THROW_AS(ShapeMismatchError, "Articulation {} has {} dofs, captured {}", articulation->getName(),
                           articulation->getDof(), snapshot_.dofs[i]);
        }
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
vector_t StateCodec::encode() const {
    checkLayout();

    vector_t state(getStateSize());
    long start = 0;
    for (const auto *actor : snapshot_.actors) {
        state.segment(start, KINEMATIC_DIM) = getActorState(*actor);
        start += KINEMATIC_DIM;
    }
    for (const auto *articulation : snapshot_.articulations) {
        const vector_t segment = getArticulationState(*articulation);
        state.segment(start, segment.size()) = segment;
        start += segment.size();
    }
    return state;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void StateCodec::decode(const vector_t &state) const {
    checkLayout();

    if (state.size() != getStateSize()) {
        EPSIM_THROW_AS(ShapeMismatchError, "State vector has size {}, the captured layout needs {}", state.size(),
                       getStateSize());
    }

    long start = 0;
    for (auto *actor : snapshot_.actors) {
        setActorState(*actor, state.segment(start, KINEMATIC_DIM));
        start += KINEMATIC_DIM;
    }
    for (size_t i = 0; i < snapshot_.articulations.size(); ++i) {
        const long size = KINEMATIC_DIM + 2 * snapshot_.dofs[i];
        setArticulationState(*snapshot_.articulations[i], state.segment(start, size));
        start += size;
    }
}

}  // namespace epsim
