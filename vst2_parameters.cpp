#include "vst2_plugin.hpp"
#include "vst2_plugin_impl.hpp"

#include <cstring>

#include "stdio_capture.hpp"

namespace kdm {

// getParameter/setParameter are called directly, not through the dispatcher.

float Vst2Plugin::getParamValue(int index) {
    AEffect* e = liveEffect();
    ScopedStdioCapture capture(!impl->verbose);
    return e->getParameter(e, index);
}

void Vst2Plugin::setParamValue(int index, float value) {
    AEffect* e = liveEffect();
    ScopedStdioCapture capture(!impl->verbose);
    e->setParameter(e, index, value);
}

std::string Vst2Plugin::getParamName(int index) {
    return dispatchString(effGetParamName, index);
}

std::string Vst2Plugin::getParamLabel(int index) {
    return dispatchString(effGetParamLabel, index);
}

std::string Vst2Plugin::getParamDisplay(int index) {
    return dispatchString(effGetParamDisplay, index);
}

std::optional<ParamProperties> Vst2Plugin::getParamProperties(int index) {
    VstParameterProperties props;
    std::memset(&props, 0, sizeof(props));
    if (dispatch(effGetParameterProperties, index, 0, &props) == 0) {
        return std::nullopt;
    }

    ParamProperties out;
    out.stepFloat = props.stepFloat;
    out.smallStepFloat = props.smallStepFloat;
    out.largeStepFloat = props.largeStepFloat;
    out.label = std::string(props.label, strnlen(props.label, sizeof(props.label)));
    out.flags = props.flags;
    out.minInteger = props.minInteger;
    out.maxInteger = props.maxInteger;
    out.stepInteger = props.stepInteger;
    out.largeStepInteger = props.largeStepInteger;
    out.shortLabel = std::string(props.shortLabel, strnlen(props.shortLabel, sizeof(props.shortLabel)));
    out.displayIndex = props.displayIndex;
    out.category = props.category;
    out.numParametersInCategory = props.numParametersInCategory;
    out.categoryLabel = std::string(props.categoryLabel, strnlen(props.categoryLabel, sizeof(props.categoryLabel)));
    return out;
}

ParameterDescriptor Vst2Plugin::describeParameter(int index) {
    ParameterDescriptor desc;
    desc.index = index;
    desc.name = getParamName(index);
    desc.label = getParamLabel(index);
    desc.display = getParamDisplay(index);
    desc.value = getParamValue(index);
    desc.properties = getParamProperties(index);
    return desc;
}

} // namespace kdm
