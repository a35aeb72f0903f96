#include "core/Finding.hpp"

#include "utils/StringUtils.hpp"

namespace core
{

JobOutcome parseJobOutcome(std::string_view text)
{
    const std::string value = Triage::Utils::toLower(Triage::Utils::trim(text));

    if (value == "failed" || value == "failure" || value == "error")
    {
        return JobOutcome::Failed;
    }
    if (value == "passed" || value == "success" || value == "succeeded")
    {
        return JobOutcome::Passed;
    }
    return JobOutcome::Unknown;
}

} // namespace core
