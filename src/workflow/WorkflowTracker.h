#pragma once
#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include "workflow/WorkflowStep.h"
#include "tools/ToolError.h"

struct WorkflowConfig {
    bool allowBranches = true;
    std::optional<int> maxSteps;
    bool logSteps = true;
};

// record_step 成功后返回给调用方的状态摘要
struct WorkflowSummary {
    int stepNumber = 0;
    int totalSteps = 0;
    bool nextStepNeeded = false;
    std::string lastStepDescription;
    std::optional<std::string> currentBranch;
    std::vector<std::string> branches;   // 已排序
    size_t stepHistoryLength = 0;

    nlohmann::json toJson() const;
};

// 已记录的步骤, totalStepsAtTime 为记录时抬升后的总步数
struct RecordedStep {
    WorkflowStep step;
    int totalStepsAtTime = 0;
};

/**
 * @brief workflow 工具的状态: 只追加的步骤日志 + 分支集合 + 当前分支
 *
 * 所有分支的步骤共用一条时间线。recordStep 在内部互斥锁下串行执行,
 * 校验失败时状态不变。每个进程一个实例, 由 AppContext 持有。
 */
class WorkflowTracker {
public:
    explicit WorkflowTracker(WorkflowConfig config = {});

    WorkflowTracker(const WorkflowTracker&) = delete;
    WorkflowTracker& operator=(const WorkflowTracker&) = delete;

    Outcome<WorkflowSummary> recordStep(const WorkflowStep& step);

    // 以下为只读快照
    size_t stepCount() const;
    int totalSteps() const;
    std::optional<std::string> currentBranch() const;
    std::vector<std::string> branches() const;
    std::vector<RecordedStep> log() const;

private:
    WorkflowConfig config;

    mutable std::mutex stateMutex;
    std::vector<RecordedStep> steps;
    std::set<std::string> branchIds;
    std::optional<std::string> activeBranch;
    int total = 0;

    std::optional<ToolError> validate(const WorkflowStep& step) const;
    bool hasStep(int stepNumber) const;
    WorkflowSummary buildSummary(const RecordedStep& recorded) const;
};
