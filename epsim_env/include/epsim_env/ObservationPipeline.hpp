#pragma once

#include <memory>
#include <vector>

#include <epsim_core/Logging.hpp>
#include <epsim_engine/Engine.hpp>
#include <epsim_engine/Renderer.hpp>
#include <epsim_env/Agent.hpp>
#include <epsim_env/EnvironmentConfig.hpp>
#include <epsim_env/Observation.hpp>
#include <epsim_env/TaskHooks.hpp>
#include <epsim_sensors/SensorRig.hpp>

namespace epsim {

/** Camera outputs to include in an image observation */
struct ImageRequest {
    bool rgb = true;
    bool depth = true;
    bool visualSeg = false;
    bool actorSeg = false;
};

/**
 * @brief Keep the ids of robot links, zero everywhere else
 *
 * @param actorSeg : actor segmentation
 * @param robotLinkIds : actor ids of the robot links
 * @return UintImage : robot segmentation, same shape as actorSeg
 */
engine::UintImage computeRobotSegmentation(const engine::UintImage &actorSeg, const std::vector<int> &robotLinkIds);

/**
 * @brief Image observations of one camera: rgb, depth, visual_seg, actor_seg, camera_intrinsic, camera_extrinsic.
 * A texture output is present only if it is requested and the camera captures its channel.
 */
ObservationDict getCameraImages(sensors::Camera &camera, const ImageRequest &request);

/**
 * @brief Point cloud of one camera in the camera frame: xyzw (N x 4, w = 1 for valid points), rgb (N x 3),
 * visual_seg and actor_seg (N x 1 x 1)
 */
ObservationDict getCameraPointcloud(sensors::Camera &camera, const ImageRequest &request);

/**
 * @brief Builds observations of the configured mode from the agent, the task and the cameras
 */
class ObservationPipeline {
   public:
    /**
     * @brief Constructor, throws ConfigurationError for point cloud and robot segmentation modes on a color-only
     * backend
     *
     * @param mode : observation mode
     * @param backend : renderer backend of the engine
     * @param enableGtSeg : add visual and actor segmentation to image observations
     */
    ObservationPipeline(ObsMode mode, engine::RendererBackend backend, bool enableGtSeg);

    /** Channels every camera has to capture in addition to its configured channels */
    engine::ChannelSet getForcedChannels() const;

    /**
     * @brief Compute the observation
     *
     * @param scene : scene, render state is synced before capturing images
     * @param rig : cameras
     * @param agent : agent, may be nullptr
     * @param task : task providing extra observations
     */
    Observation observe(engine::Scene &scene, sensors::SensorRig &rig, const Agent *agent,
                        const TaskHooks &task) const;

    ObsMode getMode() const { return mode_; }

   private:
    ObservationDict getStateDict(const Agent *agent, const TaskHooks &task) const;
    ObservationDict getImageObservation(engine::Scene &scene, sensors::SensorRig &rig, const Agent *agent,
                                        const TaskHooks &task, ImageRequest request) const;
    ObservationDict getPointcloudObservation(engine::Scene &scene, sensors::SensorRig &rig, const Agent *agent,
                                             const TaskHooks &task, ImageRequest request) const;
    ObservationDict getRobotSegObservation(ObservationDict observation, const Agent *agent) const;

    ObsMode mode_;
    engine::RendererBackend backend_;
    bool enableGtSeg_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace epsim
