#pragma once

#include "check/types.hpp"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pc::check {

// ANSI styles of the report. Set enabled=false to disable.
struct Palette {
    bool enabled = true;

    std::string action = "\033[1;32m";   // "Checking" (bold green)
    std::string error = "\033[1;31m";    // "error:" (bold red)
    std::string positive = "\033[32m";   // "ok"
    std::string negative = "\033[31m";   // "fail"
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const {
        return enabled ? code : "";
    }
    [[nodiscard]] std::string A() const { return maybe(action); }
    [[nodiscard]] std::string E() const { return maybe(error); }
    [[nodiscard]] std::string P() const { return maybe(positive); }
    [[nodiscard]] std::string N() const { return maybe(negative); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

// "  Checking <name>…", the discrepancies grouped by class, then the result line
std::string renderText(const CheckResult& result, const Palette& palette = {});

std::string renderText(const std::vector<CheckResult>& results, const Palette& palette = {});

void to_json(nlohmann::json& j, const Discrepancy& d);
void to_json(nlohmann::json& j, const CheckResult& r);

}
