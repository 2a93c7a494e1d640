#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <epsim_core/Logging.hpp>
#include <epsim_core/Types.hpp>
#include <epsim_engine/Engine.hpp>
#include <epsim_env/Action.hpp>
#include <epsim_env/Agent.hpp>
#include <epsim_env/EnvironmentConfig.hpp>
#include <epsim_env/Observation.hpp>
#include <epsim_env/ObservationPipeline.hpp>
#include <epsim_env/Rendering.hpp>
#include <epsim_env/StateCodec.hpp>
#include <epsim_env/TaskHooks.hpp>
#include <epsim_sensors/SensorRig.hpp>

namespace epsim {

enum class LifecycleState { UNINITIALIZED, CONFIGURED, EPISODE_ACTIVE, CLOSED };

std::string toString(LifecycleState state);

/** Seed used at construction */
constexpr seed_t DEFAULT_MAIN_SEED = 2022;

struct StepInfo {
    long elapsedSteps = 0;
    EvaluationInfo evaluation;
};

struct StepResult {
    Observation observation;
    scalar_t reward = 0.0;
    bool done = false;
    StepInfo info;
};

/**
 * @brief Episodic environment on top of an engine scene. Drives the task hooks through reconfigure, reset and step.
 *
 * Given the same main seed, the same per-reset seeds and the same actions, two controllers produce the same
 * observations and rewards.
 */
class EpisodeController {
   public:
    /**
     * @brief Construct the environment: validate the configuration, merge camera configurations, seed with
     * DEFAULT_MAIN_SEED and reset with reconfigure. Any error aborts construction.
     *
     * @param engine : physics and rendering engine, must outlive the controller
     * @param task : task hooks, must outlive the controller
     * @param config : environment configuration
     */
    EpisodeController(engine::Engine &engine, TaskHooks &task, const EnvironmentConfig &config);

    ~EpisodeController();

    EpisodeController(const EpisodeController &) = delete;
    EpisodeController &operator=(const EpisodeController &) = delete;

    /**
     * @brief Set the main seed and reinitialize the main rng. Reseeding after steps were taken breaks the
     * determinism of the current run and is logged as a warning.
     *
     * @param seed : main seed, drawn from std::random_device if absent
     * @return seed_t : main seed
     */
    seed_t seed(std::optional<seed_t> seed = std::nullopt);

    /**
     * @brief Destroy the scene and everything it owns, then rebuild it. If rebuilding fails, nothing of the scene is
     * kept, the controller is left UNINITIALIZED and the next reset rebuilds it.
     */
    void reconfigure();

    /**
     * @brief Start a new episode
     *
     * @param seed : episode seed, drawn from the main rng if absent
     * @param reconfigure : rebuild the scene first
     * @return Observation : first observation of the episode
     */
    Observation reset(std::optional<seed_t> seed = std::nullopt, bool reconfigure = false);

    /**
     * @brief Apply an action and advance the simulation by one control step
     */
    StepResult step(const ActionCommand &action);

    /** Simulation state followed by the task state */
    vector_t getState() const;

    /** Inverse of getState. A rejected state leaves the simulation and the task untouched. */
    void setState(const vector_t &state);

    Observation getObservation();

    /**
     * @brief Render the scene. HUMAN renders a frame in a viewer created on first use and returns nullopt. RGB_ARRAY
     * captures the camera "render_camera". CAMERAS tiles the RGB_ARRAY image with the color and depth images of
     * every other camera.
     */
    std::optional<RgbImage> render(RenderMode mode);

    /** Release viewer, cameras, agent and scene. Idempotent. */
    void close();

    int getSimFreq() const { return config_.simFreq; }
    int getControlFreq() const { return config_.controlFreq; }
    scalar_t getSimTimestep() const { return 1.0 / config_.simFreq; }
    scalar_t getControlTimestep() const { return 1.0 / config_.controlFreq; }
    long getSimStepsPerControl() const { return simStepsPerControl_; }
    long getElapsedSteps() const { return elapsedSteps_; }
    ObsMode getObsMode() const { return config_.obsMode; }
    RewardMode getRewardMode() const { return config_.rewardMode; }
    seed_t getMainSeed() const { return mainSeed_; }
    seed_t getEpisodeSeed() const { return episodeSeed_; }
    LifecycleState getLifecycleState() const { return state_; }
    engine::RendererBackend getRendererBackend() const { return backend_; }

    /** Control mode of the agent, empty without agent */
    std::string getControlMode() const;

    const ObservationSpace &getObservationSpace() const { return observationSpace_; }
    ActionSpace getActionSpace() const;

    /** Non-fatal configuration warnings */
    const std::vector<std::string> &getWarnings() const { return warnings_; }

    /** Merged camera configurations */
    const sensors::CameraConfigs &getCameraConfigs() const { return cameraConfigs_; }

    const sensors::SensorRig &getSensorRig() const { return rig_; }
    const StateCodec &getStateCodec() const { return codec_; }

    /** Current scene, nullptr once closed */
    engine::Scene *getScene() const { return scene_.get(); }
    Agent *getAgent() const { return agent_.get(); }

   private:
    void checkOpen() const;
    void checkScene() const;
    RgbImage renderRgbArray();
    RgbImage renderCameras();
    void setEpisodeRng(std::optional<seed_t> seed);
    void clear();
    void setupScene();
    void loadAgent();
    void setupCameras();
    void setupLighting();
    void setupViewer();
    void clearSimState();
    void initializeEpisode();
    void stepAction(const ActionCommand &action);
    void applyAction(const vector_t &action);
    void setControlMode(const std::string &controlMode);
    StepInfo getInfo(const Observation &observation);
    scalar_t getReward(const Observation &observation, const ActionCommand &action, const StepInfo &info);

    engine::Engine &engine_;
    TaskHooks &task_;
    EnvironmentConfig config_;
    engine::RendererBackend backend_ = engine::RendererBackend::RASTER;
    long simStepsPerControl_ = 1;
    std::vector<std::string> warnings_;
    sensors::CameraConfigs cameraConfigs_;
    std::unique_ptr<ObservationPipeline> pipeline_;

    LifecycleState state_ = LifecycleState::UNINITIALIZED;

    seed_t mainSeed_ = DEFAULT_MAIN_SEED;
    seed_t episodeSeed_ = 0;
    std::mt19937 mainRng_;
    std::mt19937 episodeRng_;
    long elapsedSteps_ = 0;

    /** Members below point into the scene and are destroyed before it */
    std::unique_ptr<engine::Scene> scene_;
    std::unique_ptr<engine::Viewer> viewer_;
    std::unique_ptr<Agent> agent_;
    SceneSnapshot snapshot_;
    StateCodec codec_;
    sensors::SensorRig rig_;

    ObservationSpace observationSpace_;

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace epsim
