#include "workflow/WorkflowTracker.h"
#include "utils/Logger.h"
#include <algorithm>

nlohmann::json WorkflowSummary::toJson() const {
    return {
        {"step_number", stepNumber},
        {"total_steps", totalSteps},
        {"next_step_needed", nextStepNeeded},
        {"last_step_description", lastStepDescription},
        {"current_branch", currentBranch ? nlohmann::json(*currentBranch) : nlohmann::json(nullptr)},
        {"branches", branches},
        {"step_history_length", stepHistoryLength}
    };
}

WorkflowTracker::WorkflowTracker(WorkflowConfig config) : config(std::move(config)) {}

bool WorkflowTracker::hasStep(int stepNumber) const {
    return std::any_of(steps.begin(), steps.end(),
                       [stepNumber](const RecordedStep& r) { return r.step.stepNumber == stepNumber; });
}

std::optional<ToolError> WorkflowTracker::validate(const WorkflowStep& step) const {
    if (config.maxSteps && step.stepNumber > *config.maxSteps) {
        return ToolError::make(ErrorKind::InvalidArgument,
                               "Step number " + std::to_string(step.stepNumber) +
                               " exceeds configured maximum of " + std::to_string(*config.maxSteps),
                               "step_number");
    }

    if (step.revisesStep && !step.isRevision) {
        return ToolError::make(ErrorKind::InvalidArgument,
                               "When specifying revises_step, is_step_revision must be set to true",
                               "revises_step");
    }

    if (step.isRevision) {
        if (!step.revisesStep) {
            return ToolError::make(ErrorKind::InvalidWorkflowReference,
                                   "is_step_revision is set but revises_step is missing",
                                   "revises_step");
        }
        if (!hasStep(*step.revisesStep)) {
            return ToolError::make(ErrorKind::InvalidWorkflowReference,
                                   "revises_step " + std::to_string(*step.revisesStep) +
                                   " does not exist in step history",
                                   "revises_step");
        }
    }

    if (step.branchFromStep) {
        if (!hasStep(*step.branchFromStep)) {
            return ToolError::make(ErrorKind::InvalidWorkflowReference,
                                   "branch_from_step " + std::to_string(*step.branchFromStep) +
                                   " does not exist in step history",
                                   "branch_from_step");
        }
        if (!step.branchId || step.branchId->empty()) {
            return ToolError::make(ErrorKind::InvalidWorkflowReference,
                                   "When creating a branch (branch_from_step), you must specify a non-empty branch_id",
                                   "branch_id");
        }
    } else if (step.branchId && !branchIds.count(*step.branchId)) {
        return ToolError::make(ErrorKind::InvalidWorkflowReference,
                               "Branch '" + *step.branchId +
                               "' does not exist; specify branch_from_step to create it",
                               "branch_id");
    }

    if (step.branchFromStep && !config.allowBranches) {
        return ToolError::make(ErrorKind::InvalidArgument,
                               "Branching is disabled in current configuration", "branch_from_step");
    }

    if (step.stepNumber < 1) {
        return ToolError::make(ErrorKind::InvalidArgument,
                               "step_number must be a positive integer, got " + std::to_string(step.stepNumber),
                               "step_number");
    }
    return std::nullopt;
}

Outcome<WorkflowSummary> WorkflowTracker::recordStep(const WorkflowStep& step) {
    std::lock_guard<std::mutex> lock(stateMutex);
    auto& logger = Logger::getInstance();

    if (auto err = validate(step)) {
        if (config.logSteps) {
            logger.warn("Workflow step rejected: " + err->message);
        }
        return *err;
    }

    int raised = std::max({total, step.stepNumber, step.totalSteps});
    if (config.logSteps && raised != step.totalSteps) {
        logger.info("Adjusting total_steps from " + std::to_string(step.totalSteps) +
                    " to " + std::to_string(raised));
    }
    total = raised;

    if (step.branchId) {
        if (branchIds.insert(*step.branchId).second && config.logSteps) {
            logger.info("Opened branch '" + *step.branchId + "' from step " +
                        std::to_string(step.branchFromStep.value_or(0)));
        }
        activeBranch = step.branchId;
    }

    steps.push_back({step, total});

    if (config.logSteps) {
        std::string line = "Workflow step " + std::to_string(step.stepNumber) + "/" + std::to_string(total) +
                           ": " + step.description;
        if (step.isRevision) line += " (revises " + std::to_string(*step.revisesStep) + ")";
        if (activeBranch) line += " [" + *activeBranch + "]";
        logger.action(line);
    }

    return buildSummary(steps.back());
}

WorkflowSummary WorkflowTracker::buildSummary(const RecordedStep& recorded) const {
    WorkflowSummary summary;
    summary.stepNumber = recorded.step.stepNumber;
    summary.totalSteps = recorded.totalStepsAtTime;
    summary.nextStepNeeded = recorded.step.nextStepNeeded;
    summary.lastStepDescription = recorded.step.description;
    summary.currentBranch = activeBranch;
    summary.branches.assign(branchIds.begin(), branchIds.end());
    summary.stepHistoryLength = steps.size();
    return summary;
}

size_t WorkflowTracker::stepCount() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return steps.size();
}

int WorkflowTracker::totalSteps() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return total;
}

std::optional<std::string> WorkflowTracker::currentBranch() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return activeBranch;
}

std::vector<std::string> WorkflowTracker::branches() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return {branchIds.begin(), branchIds.end()};
}

std::vector<RecordedStep> WorkflowTracker::log() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return steps;
}
