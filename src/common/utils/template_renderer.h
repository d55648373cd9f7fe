#ifndef LOOM_COMMON_UTILS_TEMPLATE_RENDERER_H
#define LOOM_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>
#include <filesystem> // Required by Inja for set_include_callback

namespace loom {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Renders with a shared, include-disabled environment
    static std::string render(std::string_view template_str, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

    // 递归渲染参数中包含 "{{" 的字符串值；其余值原样保留
    static Value render_params(const Value& params, const Value& data);

private:
    inja::Environment env_;
    void configure_security(); // 禁用 include 等不安全操作
};

} // namespace loom

#endif // LOOM_COMMON_UTILS_TEMPLATE_RENDERER_H
