#include <epsim_core/Throws.hpp>
#include <epsim_env/TaskHooks.hpp>

namespace epsim {

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
EvaluationInfo TaskHooks::evaluate(const Observation &observation) {
    EPSIM_THROW_AS(UnimplementedHookError, "Task does not implement evaluate");
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
scalar_t TaskHooks::computeDenseReward(const Observation &observation, const ActionCommand &action,
                                       const EvaluationInfo &info) {
    EPSIM_THROW_AS(UnimplementedHookError, "Task does not implement computeDenseReward");
}

/*********************************************************************************************************************/
/*********************************************************************************************************************/
/*********************************************************************************************************************/
void TaskHooks::setTaskState(const vector_t &state) {
    if (state.size() != 0) {
        EPSIM_THROW_AS(ShapeMismatchError, "Task has no state, got a task state of size {}", state.size());
    }
}

}  // namespace epsim
