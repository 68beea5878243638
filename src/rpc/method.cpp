#include "lmbridge/rpc/method.h"

namespace lmbridge {

const std::array<Method, kMethodCount> kAllMethods = {{
#define LMBRIDGE_METHOD_LIST(name, wire, kind) Method::name,
    LMBRIDGE_CONTRACT(LMBRIDGE_METHOD_LIST)
#undef LMBRIDGE_METHOD_LIST
}};

std::string methodName(Method method) {
    switch (method) {
#define LMBRIDGE_METHOD_NAME(name, wire, kind) case Method::name: return wire;
        LMBRIDGE_CONTRACT(LMBRIDGE_METHOD_NAME)
#undef LMBRIDGE_METHOD_NAME
    }
    return "method#" + std::to_string(static_cast<unsigned>(method));
}

std::optional<CallKind> methodKind(Method method) {
    switch (method) {
#define LMBRIDGE_METHOD_KIND(name, wire, kind) case Method::name: return CallKind::kind;
        LMBRIDGE_CONTRACT(LMBRIDGE_METHOD_KIND)
#undef LMBRIDGE_METHOD_KIND
    }
    return std::nullopt;
}

std::optional<Method> methodFromName(const std::string& name) {
    for (Method method : kAllMethods) {
        if (methodName(method) == name) {
            return method;
        }
    }
    return std::nullopt;
}

bool isContractMethod(Method method) {
    return methodKind(method).has_value();
}

} // namespace lmbridge
