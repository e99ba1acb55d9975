#include <ganttgen/layout/scene.hpp>

namespace ganttgen::layout {

namespace {

template <class... Ts> struct overload : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overload(Ts...) -> overload<Ts...>;

} // anonymous namespace

std::string_view class_name(BaseClass cls) {
    switch (cls) {
        case BaseClass::OuterLines: return "outer-lines";
        case BaseClass::InnerLines: return "inner-lines";
        case BaseClass::Item: return "item";
        case BaseClass::Resource: return "resource";
        case BaseClass::Title: return "title";
        case BaseClass::Heading: return "heading";
        case BaseClass::TaskHeading: return "task-heading";
        case BaseClass::Milestone: return "milestone";
        case BaseClass::Marker: return "marker";
    }
    return "";
}

std::string class_name(const ClassRef& cls) {
    return std::visit(
        overload{
            [](BaseClass base) { return std::string(class_name(base)); },
            [](const ResourceClass& res) {
                return "resource-" + std::to_string(res.resource) +
                       (res.variant == StyleVariant::Open ? "-open" : "-closed");
            }},
        cls);
}

} // namespace ganttgen::layout
