#include <algorithm>
#include <unordered_set>

#include <epsim_core/Throws.hpp>
#include <epsim_core/Utils.hpp>
#include <epsim_env/ObservationPipeline.hpp>

namespace epsim {

using engine::FloatImage;
using engine::TextureChannel;
using engine::UintImage;

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
UintImage computeRobotSegmentation(const UintImage &actorSeg, const std::vector<int> &robotLinkIds) {
    std::unordered_set<std::uint32_t> ids;
    for (auto id : robotLinkIds) {
        ids.insert(static_cast<std::uint32_t>(id));
    }

    UintImage robotSeg = actorSeg;
    for (auto &value : robotSeg.data) {
        if (ids.count(value) == 0) {
            value = 0;
        }
    }
    return robotSeg;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict getCameraImages(sensors::Camera &camera, const ImageRequest &request) {
    sensors::CameraTextures textures = camera.getImages();

    ObservationDict images;
    if (request.rgb && textures.color) {
        images.set("rgb", engine::sliceChannels(*textures.color, 0, 3));
    }
    if (request.depth && textures.position) {
        const FloatImage &position = *textures.position;
        FloatImage depth(position.height, position.width, 1);
        for (int r = 0; r < position.height; ++r) {
            for (int c = 0; c < position.width; ++c) {
                depth.at(r, c, 0) = -position.at(r, c, 2);
            }
        }
        images.set("depth", std::move(depth));
    }
    if (request.visualSeg && textures.segmentation) {
        images.set("visual_seg", engine::sliceChannels(*textures.segmentation, 0, 1));
    }
    if (request.actorSeg && textures.segmentation) {
        images.set("actor_seg", engine::sliceChannels(*textures.segmentation, 1, 1));
    }

    const sensors::CameraParams params = camera.getParams();
    images.set("camera_intrinsic", matrix_t(params.intrinsic));
    images.set("camera_extrinsic", matrix_t(params.extrinsic));
    return images;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
static UintImage segmentationColumn(const UintImage &segmentation, int channel) {
    UintImage column(segmentation.numPixels(), 1, 1);
    for (int r = 0; r < segmentation.height; ++r) {
        for (int c = 0; c < segmentation.width; ++c) {
            column.at(r * segmentation.width + c, 0, 0) = segmentation.at(r, c, channel);
        }
    }
    return column;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict getCameraPointcloud(sensors::Camera &camera, const ImageRequest &request) {
    sensors::CameraTextures textures = camera.getImages();

    ObservationDict pointcloud;
    if (textures.position) {
        const FloatImage &position = *textures.position;
        matrix_t xyzw(position.numPixels(), 4);
        for (int r = 0; r < position.height; ++r) {
            for (int c = 0; c < position.width; ++c) {
                const long i = static_cast<long>(r) * position.width + c;
                xyzw(i, 0) = position.at(r, c, 0);
                xyzw(i, 1) = position.at(r, c, 1);
                xyzw(i, 2) = position.at(r, c, 2);
                // Points with w >= 1 are background
                xyzw(i, 3) = position.at(r, c, 3) < 1.0f ? 1.0 : 0.0;
            }
        }
        pointcloud.set("xyzw", std::move(xyzw));
    }
    if (request.rgb && textures.color) {
        const FloatImage &color = *textures.color;
        matrix_t rgb(color.numPixels(), 3);
        for (int r = 0; r < color.height; ++r) {
            for (int c = 0; c < color.width; ++c) {
                for (int k = 0; k < 3; ++k) {
                    rgb(static_cast<long>(r) * color.width + c, k) = color.at(r, c, k);
                }
            }
        }
        pointcloud.set("rgb", std::move(rgb));
    }
    if (request.visualSeg && textures.segmentation) {
        pointcloud.set("visual_seg", segmentationColumn(*textures.segmentation, 0));
    }
    if (request.actorSeg && textures.segmentation) {
        pointcloud.set("actor_seg", segmentationColumn(*textures.segmentation, 1));
    }
    return pointcloud;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
static UintImage concatenatePoints(const std::vector<const UintImage *> &columns) {
    int numPoints = 0;
    for (const auto *column : columns) {
        numPoints += column->height;
    }
    UintImage out(numPoints, 1, 1);
    size_t offset = 0;
    for (const auto *column : columns) {
        std::copy(column->data.begin(), column->data.end(), out.data.begin() + offset);
        offset += column->data.size();
    }
    return out;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
static ObservationDict fusePointclouds(const std::vector<ObservationDict> &pointclouds) {
    ObservationDict fused;
    if (pointclouds.empty()) {
        return fused;
    }

    for (const auto &key : pointclouds.front().keys()) {
        bool shared = true;
        for (const auto &pointcloud : pointclouds) {
            shared = shared && pointcloud.contains(key);
        }
        if (!shared) {
            continue;
        }

        if (std::holds_alternative<matrix_t>(pointclouds.front().leaf(key))) {
            std::vector<std::reference_wrapper<const matrix_t>> parts;
            for (const auto &pointcloud : pointclouds) {
                parts.push_back(std::cref(std::get<matrix_t>(pointcloud.leaf(key))));
            }
            fused.set(key, mvstack(parts));
        } else {
            std::vector<const UintImage *> parts;
            for (const auto &pointcloud : pointclouds) {
                parts.push_back(&std::get<UintImage>(pointcloud.leaf(key)));
            }
            fused.set(key, concatenatePoints(parts));
        }
    }
    return fused;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationPipeline::ObservationPipeline(ObsMode mode, engine::RendererBackend backend, bool enableGtSeg)
    : mode_(mode), backend_(backend), enableGtSeg_(enableGtSeg) {
    logger_ = getLogger("observation_pipeline");

    const auto supported = engine::supportedChannels(backend_);
    if (isPointcloudMode(mode_) && !engine::containsChannel(supported, TextureChannel::POSITION)) {
        EPSIM_THROW_AS(ConfigurationError, "Obs mode {} is not supported by the {} renderer", toString(mode_),
                       engine::toString(backend_));
    }
    // Robot segmentation modes are not degraded to their base mode
    if (isRobotSegMode(mode_) && !engine::containsChannel(supported, TextureChannel::SEGMENTATION)) {
        EPSIM_THROW_AS(ConfigurationError, "Obs mode {} needs segmentation, which the {} renderer does not produce",
                       toString(mode_), engine::toString(backend_));
    }
    EPSIM_LOG_DEBUG(logger_, "Observation mode: {}, renderer: {}", toString(mode_), engine::toString(backend_));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
engine::ChannelSet ObservationPipeline::getForcedChannels() const {
    engine::ChannelSet channels;
    if (isPointcloudMode(mode_)) {
        channels.push_back(TextureChannel::POSITION);
    }
    if (isImageMode(mode_) && (isRobotSegMode(mode_) || enableGtSeg_)) {
        channels.push_back(TextureChannel::SEGMENTATION);
    }
    return channels;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
Observation ObservationPipeline::observe(engine::Scene &scene, sensors::SensorRig &rig, const Agent *agent,
                                         const TaskHooks &task) const {
    ImageRequest robotSegRequest;
    robotSegRequest.actorSeg = true;

    switch (mode_) {
        case ObsMode::NONE:
            return ObservationDict();
        case ObsMode::STATE:
            return flattenStateDict(getStateDict(agent, task));
        case ObsMode::STATE_DICT:
            return getStateDict(agent, task);
        case ObsMode::RGBD:
            return getImageObservation(scene, rig, agent, task, ImageRequest());
        case ObsMode::POINTCLOUD:
            return getPointcloudObservation(scene, rig, agent, task, ImageRequest());
        case ObsMode::RGBD_ROBOT_SEG:
            return getRobotSegObservation(getImageObservation(scene, rig, agent, task, robotSegRequest), agent);
        case ObsMode::POINTCLOUD_ROBOT_SEG:
            return getRobotSegObservation(getPointcloudObservation(scene, rig, agent, task, robotSegRequest), agent);
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported obs mode: {}", static_cast<int>(mode_));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict ObservationPipeline::getStateDict(const Agent *agent, const TaskHooks &task) const {
    ObservationDict observation;
    observation.set("agent", agent != nullptr ? agent->getProprioception() : ObservationDict());
    observation.set("extra", task.getExtraObservation());
    return observation;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict ObservationPipeline::getImageObservation(engine::Scene &scene, sensors::SensorRig &rig,
                                                         const Agent *agent, const TaskHooks &task,
                                                         ImageRequest request) const {
    if (enableGtSeg_) {
        request.visualSeg = true;
        request.actorSeg = true;
    }
    if (backend_ == engine::RendererBackend::RAY_TRACING) {
        request.depth = false;
        request.visualSeg = false;
        request.actorSeg = false;
    }

    scene.updateRender();
    rig.captureAll();

    ObservationDict observation;
    ObservationDict &images = observation.child("image");
    for (const auto &camera : rig.getCameras()) {
        images.set(camera->getUuid(), getCameraImages(*camera, request));
    }
    observation.set("agent", agent != nullptr ? agent->getProprioception() : ObservationDict());
    observation.set("extra", task.getExtraObservation());
    return observation;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict ObservationPipeline::getPointcloudObservation(engine::Scene &scene, sensors::SensorRig &rig,
                                                              const Agent *agent, const TaskHooks &task,
                                                              ImageRequest request) const {
    if (enableGtSeg_) {
        request.visualSeg = true;
        request.actorSeg = true;
    }

    scene.updateRender();
    rig.captureAll();

    std::vector<ObservationDict> pointclouds;
    for (const auto &camera : rig.getCameras()) {
        ObservationDict pointcloud = getCameraPointcloud(*camera, request);
        if (pointcloud.contains("xyzw")) {
            // Camera frame to world frame, points are rows
            matrix_t &xyzw = std::get<matrix_t>(pointcloud.leaf("xyzw"));
            const matrix_t world = xyzw * camera->getModelMatrix().transpose();
            xyzw = world;
        }
        pointclouds.push_back(std::move(pointcloud));
    }

    ObservationDict observation;
    observation.set("pointcloud", fusePointclouds(pointclouds));
    observation.set("agent", agent != nullptr ? agent->getProprioception() : ObservationDict());
    observation.set("extra", task.getExtraObservation());
    return observation;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ObservationDict ObservationPipeline::getRobotSegObservation(ObservationDict observation, const Agent *agent) const {
    const std::vector<int> robotLinkIds = agent != nullptr ? agent->getRobotLinkIds() : std::vector<int>();

    std::vector<ObservationDict *> targets;
    if (isPointcloudMode(mode_)) {
        targets.push_back(&observation.dict("pointcloud"));
    } else {
        ObservationDict &images = observation.dict("image");
        for (const auto &uuid : images.keys()) {
            targets.push_back(&images.dict(uuid));
        }
    }

    for (auto *target : targets) {
        if (!target->contains("actor_seg")) {
            continue;
        }
        const UintImage actorSeg = std::get<UintImage>(target->pop("actor_seg"));
        target->set("robot_seg", computeRobotSegmentation(actorSeg, robotLinkIds));
    }
    return observation;
}

}  // namespace epsim
