#pragma once
#include <string>
#include <optional>

/**
 * @brief workflow 工具的一次调用 (一个推理步骤)
 *
 * 被 WorkflowTracker 接受后不可再修改。
 */
struct WorkflowStep {
    int stepNumber = 0;
    std::string description;
    int totalSteps = 0;         // 调用方给出的总步数估计
    bool nextStepNeeded = false;
    bool isRevision = false;
    std::optional<int> revisesStep;
    std::optional<int> branchFromStep;
    std::optional<std::string> branchId;
    std::optional<bool> needsMoreSteps;
};
