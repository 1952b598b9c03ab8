#pragma once

#include "BatchController.hpp"
#include <iosfwd>
#include <string>

namespace retopo::pipeline {

// 纯函数：审阅统计的文本形式（原始面数、各 LOD 面数与策略、预算警告）
[[nodiscard]] std::string formatReviewStats(const ReviewStats& stats);

// 控制台交互审阅：[a]pprove / [s]kip / [r]edo / [q]uit
class ConsoleReviewer : public IReviewer {
public:
    ConsoleReviewer(std::istream& input, std::ostream& output)
        : input_(input), output_(output) {}

    // 输入结束视为 Quit
    ReviewOutcome review(const ReviewStats& stats) override;

private:
    std::istream& input_;
    std::ostream& output_;

    std::optional<std::vector<core::LodSpec>> promptTargets();
};

// 全部批准（--auto-approve）
class AutoApproveReviewer : public IReviewer {
public:
    ReviewOutcome review(const ReviewStats& stats) override;
};

} // namespace retopo::pipeline
