#pragma once

#include <memory>
#include <string>
#include <vector>

#include <epsim_core/Rotations.hpp>
#include <epsim_core/Types.hpp>
#include <epsim_engine/Renderer.hpp>
#include <epsim_engine/Texture.hpp>
#include <yaml-cpp/yaml.h>

namespace epsim {
namespace engine {

enum class ActorType { STATIC, KINEMATIC, DYNAMIC };

struct Pose {
    vector3_t position = vector3_t::Zero();
    quaternion_t orientation = quaternion_t::Identity();

    matrix4_t toTransformationMatrix() const { return pose2mat(position, orientation); }
};

/** Physical parameters of a scene */
struct SceneConfig {
    scalar_t defaultDynamicFriction = 1.0;
    scalar_t defaultStaticFriction = 1.0;
    scalar_t defaultRestitution = 0.0;
    scalar_t contactOffset = 0.02;
    bool enablePcm = false;
    int solverIterations = 25;
    int solverVelocityIterations = 0;
};

/**
 * @brief Parse a scene configuration block, keys: default_dynamic_friction, default_static_friction,
 * default_restitution, contact_offset, enable_pcm, solver_iterations, solver_velocity_iterations
 */
SceneConfig parseSceneConfig(const YAML::Node &node);

struct ActorDescription {
    std::string name;
    ActorType type = ActorType::DYNAMIC;
    Pose pose;
};

struct ArticulationDescription {
    std::string name;

    /** Asset to load the articulation from, e.g. a URDF path. Interpretation is up to the engine. */
    std::string source;

    /** Link names, root link first */
    std::vector<std::string> linkNames;

    long dof = 0;
    Pose rootPose;
    bool fixRootLink = true;
};

/**
 * @brief Single rigid body, either a free actor or an articulation link. Owned by the scene.
 */
class Actor {
   public:
    virtual ~Actor() = default;

    virtual const std::string &getName() const = 0;

    /** Id written into the actor-level segmentation texture */
    virtual int getId() const = 0;

    virtual ActorType getType() const = 0;

    virtual Pose getPose() const = 0;
    virtual void setPose(const Pose &pose) = 0;

    virtual vector3_t getVelocity() const = 0;
    virtual void setVelocity(const vector3_t &velocity) = 0;

    virtual vector3_t getAngularVelocity() const = 0;
    virtual void setAngularVelocity(const vector3_t &angularVelocity) = 0;
};

/**
 * @brief Kinematic chain of links connected by joints. Owned by the scene.
 */
class Articulation {
   public:
    virtual ~Articulation() = default;

    virtual const std::string &getName() const = 0;

    /** Links, root link first */
    virtual std::vector<Actor *> getLinks() const = 0;

    /** Number of degrees of freedom */
    virtual long getDof() const = 0;

    virtual Pose getRootPose() const = 0;
    virtual void setRootPose(const Pose &pose) = 0;

    virtual vector3_t getRootVelocity() const = 0;
    virtual void setRootVelocity(const vector3_t &velocity) = 0;

    virtual vector3_t getRootAngularVelocity() const = 0;
    virtual void setRootAngularVelocity(const vector3_t &angularVelocity) = 0;

    /** Joint positions, size getDof() */
    virtual vector_t getQpos() const = 0;
    virtual void setQpos(const vector_t &qpos) = 0;

    /** Joint velocities, size getDof() */
    virtual vector_t getQvel() const = 0;
    virtual void setQvel(const vector_t &qvel) = 0;
};

/**
 * @brief Camera sensor living in a scene. Owned by the scene.
 */
class CameraSensor {
   public:
    virtual ~CameraSensor() = default;

    virtual const std::string &getName() const = 0;
    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;

    /** Pose relative to the mount, or to the world for a free camera */
    virtual void setLocalPose(const Pose &pose) = 0;

    /**
     * @brief Start capturing all textures. Non-blocking with respect to other sensors, the textures become
     * available once the getters below are called.
     */
    virtual void takePicture() = 0;

    /**
     * @brief Read a float texture (COLOR or POSITION), H x W x 4. Position is expressed in the camera frame.
     */
    virtual FloatImage getFloatTexture(TextureChannel channel) = 0;

    /**
     * @brief Read an unsigned texture (SEGMENTATION), H x W x 4. Channel 0 holds visual (mesh) ids, channel 1 holds
     * actor ids.
     */
    virtual UintImage getUintTexture(TextureChannel channel) = 0;

    virtual matrix3_t getIntrinsicMatrix() const = 0;

    /** World to camera transform */
    virtual matrix4_t getExtrinsicMatrix() const = 0;

    /** Camera to world transform */
    virtual matrix4_t getModelMatrix() const = 0;
};

/**
 * @brief Simulation scene: bodies, sensors and lights sharing one physics world
 */
class Scene {
   public:
    virtual ~Scene() = default;

    virtual void setTimestep(scalar_t timestep) = 0;
    virtual scalar_t getTimestep() const = 0;

    /** Advance physics by one timestep */
    virtual void step() = 0;

    /** Sync render state with physics state, must precede any picture */
    virtual void updateRender() = 0;

    virtual Actor *addActor(const ActorDescription &description) = 0;
    virtual Articulation *addArticulation(const ArticulationDescription &description) = 0;

    /** All free actors in engine order. Articulation links are not included. */
    virtual std::vector<Actor *> getAllActors() const = 0;

    /** All articulations in engine order */
    virtual std::vector<Articulation *> getAllArticulations() const = 0;

    virtual CameraSensor *addCamera(const std::string &name, int width, int height, scalar_t fov, scalar_t near,
                                    scalar_t far) = 0;
    virtual CameraSensor *addMountedCamera(const std::string &name, Actor *mount, const Pose &pose, int width,
                                           int height, scalar_t fov, scalar_t near, scalar_t far) = 0;

    virtual void setAmbientLight(const vector3_t &color) = 0;
    virtual void addDirectionalLight(const vector3_t &direction, const vector3_t &color, bool shadow = false,
                                     scalar_t scale = 10.0, int shadowMapSize = 2048) = 0;
};

/**
 * @brief Interactive viewer window
 */
class Viewer {
   public:
    virtual ~Viewer() = default;

    virtual void setScene(Scene *scene) = 0;
    virtual void render() = 0;
    virtual void close() = 0;
};

/**
 * @brief Physics and rendering engine
 */
class Engine {
   public:
    virtual ~Engine() = default;

    /** Select and configure the renderer used by scenes created afterwards */
    virtual void setRenderer(const RendererConfig &config) = 0;
    virtual RendererBackend getRendererBackend() const = 0;

    virtual std::unique_ptr<Scene> createScene(const SceneConfig &config) = 0;
    virtual std::unique_ptr<Viewer> createViewer() = 0;
};

}  // namespace engine
}  // namespace epsim
