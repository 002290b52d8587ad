#include "control.hpp"

#include "console.hpp"
#include "privileged_writer.hpp"
#include "sysfs_io.hpp"

namespace amdopt {

ControlWriter::ControlWriter(PrivilegedWriter& writer, Console& console)
    : writer_(writer), console_(console) {}

WriteOutcome ControlWriter::apply(const std::string& device, const std::string& path,
                                  const Step& step) {
    const std::string label = attribute_label(step.attribute);
    if (path.empty() || !exists(path)) {
        console_.warning(device + ": " + label + " control not available");
        return WriteOutcome::Unsupported;
    }

    WriteResult r = writer_.write(path, step.value);
    if (!r.ok) {
        console_.error(device + ": failed to set " + label + " to " + describe_value(step) +
                       (r.error.empty() ? "" : " (" + r.error + ")"));
        return WriteOutcome::Failed;
    }
    console_.status(device + ": " + label + " set to " + describe_value(step));
    return WriteOutcome::Applied;
}

std::vector<WriteOutcome> ControlWriter::apply_all(
    const std::string& device, const std::vector<Step>& steps,
    const std::function<std::string(Attribute)>& path_of) {
    std::vector<WriteOutcome> outcomes;
    size_t applied = 0;
    for (const auto& step : steps) {
        WriteOutcome o = apply(device, path_of(step.attribute), step);
        if (o == WriteOutcome::Applied) ++applied;
        outcomes.push_back(o);
    }
    if (applied > 0 && applied < steps.size()) {
        console_.warning(device + ": partially applied (" + std::to_string(applied) + " of " +
                         std::to_string(steps.size()) + " settings)");
    }
    return outcomes;
}

}  // namespace amdopt
