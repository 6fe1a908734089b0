#include "weave/di/factory.hpp"

namespace weave::di {

namespace {

std::string describe_return(const std::optional<std::type_index>& type) {
    return type ? class_name(*type) : "<unknown>";
}

}  // namespace

Factory::Factory(NoArgs fn, std::optional<std::type_index> return_type)
    : kind_(Kind::NO_ARGS), return_type_(std::move(return_type)) {
    if (!fn) {
        throw InvalidFactory(describe_return(return_type_));
    }
    invoke_ = [fn = std::move(fn)](ActivationScope&, const ServiceKey&) {
        return fn();
    };
}

Factory::Factory(WithScope fn, std::optional<std::type_index> return_type)
    : kind_(Kind::WITH_SCOPE), return_type_(std::move(return_type)) {
    if (!fn) {
        throw InvalidFactory(describe_return(return_type_));
    }
    invoke_ = [fn = std::move(fn)](ActivationScope& scope, const ServiceKey&) {
        return fn(scope);
    };
}

Factory::Factory(WithScopeAndType fn, std::optional<std::type_index> return_type)
    : kind_(Kind::WITH_SCOPE_AND_TYPE),
      invoke_(std::move(fn)),
      return_type_(std::move(return_type)) {
    if (!invoke_) {
        throw InvalidFactory(describe_return(return_type_));
    }
}

}  // namespace weave::di
