#pragma once

#include <functional>
#include <string>
#include <vector>

#include "modes.hpp"

namespace amdopt {

class Console;
class PrivilegedWriter;

enum class WriteOutcome { Applied, Unsupported, Failed };

// Applies (attribute, value) pairs to one device at a time and reports each
// result. Never validates the value, never rolls back.
class ControlWriter {
public:
    ControlWriter(PrivilegedWriter& writer, Console& console);

    // Absent file -> Unsupported (warning). Write error -> Failed (error line).
    WriteOutcome apply(const std::string& device, const std::string& path, const Step& step);

    // Runs steps in order on one device. Prints a partial-failure line when
    // some but not all of them were applied.
    std::vector<WriteOutcome> apply_all(const std::string& device, const std::vector<Step>& steps,
                                        const std::function<std::string(Attribute)>& path_of);

private:
    PrivilegedWriter& writer_;
    Console& console_;
};

}  // namespace amdopt
