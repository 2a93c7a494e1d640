#include <algorithm>
#include <cmath>

#include <epsim_core/Throws.hpp>
#include <epsim_core/Utils.hpp>
#include <epsim_env/EpisodeController.hpp>

namespace epsim {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::string toString(LifecycleState state) {
    switch (state) {
        case LifecycleState::UNINITIALIZED:
            return "uninitialized";
        case LifecycleState::CONFIGURED:
            return "configured";
        case LifecycleState::EPISODE_ACTIVE:
            return "episode_active";
        case LifecycleState::CLOSED:
            return "closed";
    }
    return "unknown";
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
EpisodeController::EpisodeController(engine::Engine &engine, TaskHooks &task, const EnvironmentConfig &config)
    : engine_(engine), task_(task), config_(config) {
    logger_ = getLogger("episode_controller");

    // Simulation and control frequency
    if (config_.simFreq <= 0 || config_.controlFreq <= 0) {
        EPSIM_THROW_AS(ConfigurationError, "sim_freq ({}) and control_freq ({}) must be positive", config_.simFreq,
                       config_.controlFreq);
    }
    simStepsPerControl_ = config_.simFreq / config_.controlFreq;
    if (simStepsPerControl_ < 1) {
        EPSIM_THROW_AS(ConfigurationError, "sim_freq ({}) must not be lower than control_freq ({})", config_.simFreq,
                       config_.controlFreq);
    }
    if (config_.simFreq % config_.controlFreq != 0) {
        const std::string warning = fmt::format("sim_freq({}) is not divisible by control_freq({}), using {} substeps",
                                                config_.simFreq, config_.controlFreq, simStepsPerControl_);
        EPSIM_LOG_WARN(logger_, "{}", warning);
        warnings_.push_back(warning);
    }

    // Renderer
    engine_.setRenderer(config_.renderer);
    backend_ = engine_.getRendererBackend();
    if (backend_ == engine::RendererBackend::RAY_TRACING) {
        EPSIM_LOG_WARN(logger_, "Only color is supported by the {} renderer", engine::toString(backend_));
    }
    pipeline_ = std::make_unique<ObservationPipeline>(config_.obsMode, backend_, config_.enableGtSeg);

    // Cameras: task defaults, then agent cameras, then user overrides
    cameraConfigs_ = task_.getCameraConfigs();
    sensors::mergeCameraConfigs(cameraConfigs_, task_.getAgentCameraConfigs());
    sensors::updateCameraConfigs(cameraConfigs_, config_.cameraOverrides);
    sensors::validateCameraConfigs(cameraConfigs_);

    state_ = LifecycleState::CONFIGURED;
    EPSIM_LOG_INFO(logger_, "Configured: obs_mode={}, reward_mode={}, sim_freq={}, control_freq={}, cameras={}",
                   toString(config_.obsMode), toString(config_.rewardMode), config_.simFreq, config_.controlFreq,
                   cameraConfigs_.size());

    seed(DEFAULT_MAIN_SEED);
    const Observation observation = reset(std::nullopt, true);
    observationSpace_ = ObservationSpace::fromObservation(observation);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
EpisodeController::~EpisodeController() {
    close();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::checkOpen() const {
    if (state_ == LifecycleState::CLOSED) {
        EPSIM_THROW("EpisodeController is closed");
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::checkScene() const {
    checkOpen();
    if (scene_ == nullptr) {
        EPSIM_THROW("No scene loaded, reset the environment first");
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
seed_t EpisodeController::seed(std::optional<seed_t> seed) {
    checkOpen();
    if (state_ == LifecycleState::EPISODE_ACTIVE && elapsedSteps_ > 0) {
        EPSIM_LOG_WARN(logger_, "Reseeding after {} steps, the current run is no longer reproducible", elapsedSteps_);
    }
    mainSeed_ = seed ? *seed : static_cast<seed_t>(std::random_device()());
    mainRng_.seed(mainSeed_);
    EPSIM_LOG_DEBUG(logger_, "Main seed: {}", mainSeed_);
    return mainSeed_;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::setEpisodeRng(std::optional<seed_t> seed) {
    episodeSeed_ = seed ? *seed : static_cast<seed_t>(mainRng_());
    episodeRng_.seed(episodeSeed_);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::clear() {
    rig_.clear();
    codec_.invalidate();
    snapshot_.clear();
    agent_.reset();
    if (viewer_) {
        viewer_->setScene(nullptr);
    }
    scene_.reset();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::reconfigure() {
    checkOpen();
    clear();
    state_ = LifecycleState::UNINITIALIZED;

    try {
        setupScene();
        loadAgent();
        task_.loadActors(*scene_, episodeRng_);
        task_.loadArticulations(*scene_, episodeRng_);

        // Fix the state layout before anything else touches the scene
        snapshot_ = SceneSnapshot::capture(*scene_);
        codec_.capture(snapshot_, *scene_);

        setupCameras();
        setupLighting();
    } catch (...) {
        // Drop the partial scene, the next reset rebuilds from scratch
        clear();
        EPSIM_LOG_ERROR(logger_, "Reconfigure failed, the scene was released");
        throw;
    }

    if (viewer_) {
        setupViewer();
    }

    state_ = LifecycleState::CONFIGURED;
    EPSIM_LOG_INFO(logger_, "Reconfigured: {} actors, {} articulations, {} cameras, state size {}",
                   snapshot_.actors.size(), snapshot_.articulations.size(), rig_.size(), codec_.getStateSize());
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::setupScene() {
    scene_ = engine_.createScene(config_.sceneConfig);
    EPSIM_THROW_IF(scene_ == nullptr, "Engine failed to create a scene");
    scene_->setTimestep(getSimTimestep());
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::loadAgent() {
    agent_ = task_.loadAgent(*scene_, episodeRng_);
    if (config_.controlMode.empty()) {
        return;
    }
    if (!agent_) {
        EPSIM_THROW_AS(ConfigurationError, "Control mode {} requested, but the task has no agent", config_.controlMode);
    }
    const auto supported = agent_->getSupportedControlModes();
    if (std::find(supported.begin(), supported.end(), config_.controlMode) == supported.end()) {
        EPSIM_THROW_AS(ConfigurationError, "Unsupported control mode: {}. Expected one of {}", config_.controlMode,
                       supported);
    }
    agent_->setControlMode(config_.controlMode);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::setupCameras() {
    rig_.build(cameraConfigs_, *scene_, backend_, pipeline_->getForcedChannels());
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::setupLighting() {
    scene_->setAmbientLight(vector3_t(0.3, 0.3, 0.3));
    // Only the first directional light casts shadows
    scene_->addDirectionalLight(vector3_t(1.0, 1.0, -1.0), vector3_t(1.0, 1.0, 1.0), config_.enableShadow, 5.0, 2048);
    scene_->addDirectionalLight(vector3_t(0.0, 0.0, -1.0), vector3_t(1.0, 1.0, 1.0));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::setupViewer() {
    viewer_->setScene(scene_.get());
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
Observation EpisodeController::reset(std::optional<seed_t> seed, bool reconfigure) {
    checkOpen();
    setEpisodeRng(seed);
    elapsedSteps_ = 0;

    if (reconfigure || scene_ == nullptr) {
        this->reconfigure();
    } else {
        clearSimState();
    }
    state_ = LifecycleState::CONFIGURED;

    // Same episode seed, same initialization, whether or not the scene was rebuilt
    setEpisodeRng(episodeSeed_);
    initializeEpisode();

    state_ = LifecycleState::EPISODE_ACTIVE;
    EPSIM_LOG_DEBUG(logger_, "Reset with episode seed {}", episodeSeed_);
    return getObservation();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::clearSimState() {
    for (auto *actor : scene_->getAllActors()) {
        if (actor->getType() != engine::ActorType::STATIC) {
            actor->setVelocity(vector3_t::Zero());
            actor->setAngularVelocity(vector3_t::Zero());
        }
    }
    for (auto *articulation : scene_->getAllArticulations()) {
        articulation->setQvel(vector_t::Zero(articulation->getDof()));
        articulation->setRootVelocity(vector3_t::Zero());
        articulation->setRootAngularVelocity(vector3_t::Zero());
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::initializeEpisode() {
    task_.initializeActors(episodeRng_);
    task_.initializeArticulations(episodeRng_);
    task_.initializeAgent(agent_.get(), episodeRng_);
    task_.initializeTask(episodeRng_);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
StepResult EpisodeController::step(const ActionCommand &action) {
    checkOpen();
    if (state_ != LifecycleState::EPISODE_ACTIVE) {
        EPSIM_THROW("Cannot step in state {}, call reset first", toString(state_));
    }

    stepAction(action);
    ++elapsedSteps_;

    StepResult result;
    result.observation = getObservation();
    result.info = getInfo(result.observation);
    result.reward = getReward(result.observation, action, result.info);
    result.done = result.info.evaluation.success;
    return result;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::stepAction(const ActionCommand &action) {
    if (const auto *raw = std::get_if<vector_t>(&action)) {
        applyAction(*raw);
    } else if (const auto *structured = std::get_if<StructuredAction>(&action)) {
        if (!agent_) {
            EPSIM_THROW_AS(ActionTypeError, "Structured action for control mode {}, but the task has no agent",
                           structured->controlMode);
        }
        if (structured->controlMode != agent_->getControlMode()) {
            setControlMode(structured->controlMode);
        }
        applyAction(structured->payload);
    }

    task_.beforeControlStep();
    for (long i = 0; i < simStepsPerControl_; ++i) {
        if (agent_) {
            agent_->beforeSimulationStep();
        }
        scene_->step();
        task_.afterSimulationStep();
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::applyAction(const vector_t &action) {
    if (!agent_) {
        if (action.size() != 0) {
            EPSIM_THROW_AS(ActionTypeError, "Got an action of size {}, but the task has no agent", action.size());
        }
        return;
    }
    const long expected = agent_->getActionSize();
    if (action.size() != expected) {
        EPSIM_THROW_AS(ActionTypeError, "Action of size {} does not match control mode {}, expected size {}",
                       action.size(), agent_->getControlMode(), expected);
    }
    agent_->setAction(action);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::setControlMode(const std::string &controlMode) {
    const auto supported = agent_->getSupportedControlModes();
    if (std::find(supported.begin(), supported.end(), controlMode) == supported.end()) {
        EPSIM_THROW_AS(ActionTypeError, "Unsupported control mode: {}. Expected one of {}", controlMode, supported);
    }
    EPSIM_LOG_DEBUG(logger_, "Switching control mode: {} -> {}", agent_->getControlMode(), controlMode);
    agent_->setControlMode(controlMode);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
StepInfo EpisodeController::getInfo(const Observation &observation) {
    StepInfo info;
    info.elapsedSteps = elapsedSteps_;
    info.evaluation = task_.evaluate(observation);
    return info;
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
scalar_t EpisodeController::getReward(const Observation &observation, const ActionCommand &action,
                                      const StepInfo &info) {
    switch (config_.rewardMode) {
        case RewardMode::SPARSE:
            return info.evaluation.success ? 1.0 : 0.0;
        case RewardMode::DENSE:
            return task_.computeDenseReward(observation, action, info.evaluation);
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported reward mode: {}", static_cast<int>(config_.rewardMode));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
vector_t EpisodeController::getState() const {
    checkOpen();
    const vector_t simState = codec_.encode();
    const vector_t taskState = task_.getTaskState();
    return vvstack({simState, taskState});
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::setState(const vector_t &state) {
    checkOpen();
    const long simStateSize = codec_.getStateSize();
    if (state.size() < simStateSize) {
        EPSIM_THROW_AS(ShapeMismatchError, "State vector has size {}, the simulation state alone needs {}",
                       state.size(), simStateSize);
    }

    // The task validates its own segment, roll the simulation back if it rejects it
    const vector_t backup = codec_.encode();
    codec_.decode(state.head(simStateSize));
    try {
        task_.setTaskState(state.tail(state.size() - simStateSize));
    } catch (...) {
        codec_.decode(backup);
        throw;
    }
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
Observation EpisodeController::getObservation() {
    checkScene();
    return pipeline_->observe(*scene_, rig_, agent_.get(), task_);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::optional<RgbImage> EpisodeController::render(RenderMode mode) {
    checkScene();
    scene_->updateRender();

    switch (mode) {
        case RenderMode::HUMAN:
            if (!viewer_) {
                viewer_ = engine_.createViewer();
                EPSIM_THROW_IF(viewer_ == nullptr, "Engine failed to create a viewer");
                setupViewer();
            }
            viewer_->render();
            return std::nullopt;
        case RenderMode::RGB_ARRAY:
            return renderRgbArray();
        case RenderMode::CAMERAS:
            return renderCameras();
    }
    EPSIM_THROW_AS(ConfigurationError, "Unsupported render mode: {}", static_cast<int>(mode));
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
RgbImage EpisodeController::renderRgbArray() {
    const sensors::CameraTextures textures = rig_.getCamera("render_camera").getImages(true);
    if (!textures.color) {
        EPSIM_THROW_AS(ConfigurationError, "Camera render_camera does not capture color");
    }
    return colorToRgb(*textures.color);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
RgbImage EpisodeController::renderCameras() {
    std::vector<RgbImage> images = {renderRgbArray()};

    // Sync again, visual-only markers may differ between the render camera and the other cameras
    scene_->updateRender();

    for (const auto &camera : rig_.getCameras()) {
        if (camera->getUuid() == "render_camera") {
            continue;
        }
        for (auto &image : texturesToImages(camera->getImages(true))) {
            images.push_back(std::move(image));
        }
    }
    return tileImages(images);
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void EpisodeController::close() {
    if (state_ == LifecycleState::CLOSED) {
        return;
    }
    if (viewer_) {
        viewer_->close();
        viewer_.reset();
    }
    clear();
    state_ = LifecycleState::CLOSED;
    EPSIM_LOG_INFO(logger_, "Closed");
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
std::string EpisodeController::getControlMode() const {
    return agent_ ? agent_->getControlMode() : std::string();
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
ActionSpace EpisodeController::getActionSpace() const {
    ActionSpace space;
    if (agent_) {
        space.controlMode = agent_->getControlMode();
        space.size = agent_->getActionSize();
    }
    return space;
}

}  // namespace epsim
