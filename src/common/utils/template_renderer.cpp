// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <mutex>
#include <stdexcept>

namespace loom {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    // inja::Environment is not safe for concurrent use
    static InjaTemplateRenderer renderer;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

Value InjaTemplateRenderer::render_params(const Value& params, const Value& data) {
    if (params.is_string()) {
        const auto& s = params.get_ref<const std::string&>();
        if (s.find("{{") == std::string::npos && s.find("{%") == std::string::npos) {
            return params;
        }
        return render(s, data);
    }
    if (params.is_array()) {
        Value out = Value::array();
        for (const auto& item : params) {
            out.push_back(render_params(item, data));
        }
        return out;
    }
    if (params.is_object()) {
        Value out = Value::object();
        for (auto it = params.begin(); it != params.end(); ++it) {
            out[it.key()] = render_params(it.value(), data);
        }
        return out;
    }
    return params;
}

} // namespace loom
