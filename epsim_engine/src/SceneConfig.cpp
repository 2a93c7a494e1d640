#include <epsim_core/config/Config.hpp>
#include <epsim_engine/Engine.hpp>

namespace epsim {
namespace engine {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
SceneConfig parseSceneConfig(const YAML::Node &node) {
    SceneConfig config;
    if (!node || node.IsNull()) {
        return config;
    }

    checkConfigKeys(node,
                    {"default_dynamic_friction", "default_static_friction", "default_restitution", "contact_offset",
                     "enable_pcm", "solver_iterations", "solver_velocity_iterations"},
                    "scene");

    config.defaultDynamicFriction = node["default_dynamic_friction"].as<scalar_t>(config.defaultDynamicFriction);
    config.defaultStaticFriction = node["default_static_friction"].as<scalar_t>(config.defaultStaticFriction);
    config.defaultRestitution = node["default_restitution"].as<scalar_t>(config.defaultRestitution);
    config.contactOffset = node["contact_offset"].as<scalar_t>(config.contactOffset);
    config.enablePcm = node["enable_pcm"].as<bool>(config.enablePcm);
    config.solverIterations = node["solver_iterations"].as<int>(config.solverIterations);
    config.solverVelocityIterations = node["solver_velocity_iterations"].as<int>(config.solverVelocityIterations);
    return config;
}

}  // namespace engine
}  // namespace epsim
