#pragma once

#include <string>

// Run marker: ".Failure" while a run is in progress, ".Success" once a job fully completed.
namespace FailureDetect
{
    void Initialize(const std::string& MarkerDir);
    bool MarkFailure();
    bool MarkSuccess();
    bool WasLastSuccess();
    bool WasLastFailure();
}
