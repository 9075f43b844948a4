/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "layer_config.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace csn::config {

    namespace {
        template <typename E>
        struct NameEntry {
            E value;
            std::string_view name;       ///< snake_case, as written in configs
            std::string_view class_name; ///< CamelCase, as written in {"class_name": ...}
        };

        constexpr std::array<NameEntry<PaddingMode>, 2> PADDING_NAMES{{
            {PaddingMode::Valid, "valid", "valid"},
            {PaddingMode::Same, "same", "same"},
        }};

        constexpr std::array<NameEntry<Activation>, 10> ACTIVATION_NAMES{{
            {Activation::Linear, "linear", "linear"},
            {Activation::Relu, "relu", "relu"},
            {Activation::Tanh, "tanh", "tanh"},
            {Activation::Sigmoid, "sigmoid", "sigmoid"},
            {Activation::HardSigmoid, "hard_sigmoid", "hard_sigmoid"},
            {Activation::Elu, "elu", "elu"},
            {Activation::Selu, "selu", "selu"},
            {Activation::Softplus, "softplus", "softplus"},
            {Activation::Softsign, "softsign", "softsign"},
            {Activation::Exponential, "exponential", "exponential"},
        }};

        using InitKind = InitializerSpec::Kind;
        constexpr std::array<NameEntry<InitKind>, 11> INITIALIZER_NAMES{{
            {InitKind::Zeros, "zeros", "Zeros"},
            {InitKind::Ones, "ones", "Ones"},
            {InitKind::Constant, "constant", "Constant"},
            {InitKind::RandomUniform, "random_uniform", "RandomUniform"},
            {InitKind::RandomNormal, "random_normal", "RandomNormal"},
            {InitKind::GlorotUniform, "glorot_uniform", "GlorotUniform"},
            {InitKind::GlorotNormal, "glorot_normal", "GlorotNormal"},
            {InitKind::HeUniform, "he_uniform", "HeUniform"},
            {InitKind::HeNormal, "he_normal", "HeNormal"},
            {InitKind::LecunUniform, "lecun_uniform", "LecunUniform"},
            {InitKind::LecunNormal, "lecun_normal", "LecunNormal"},
        }};

        using ConstraintKind = ConstraintSpec::Kind;
        constexpr std::array<NameEntry<ConstraintKind>, 3> CONSTRAINT_NAMES{{
            {ConstraintKind::NonNeg, "non_neg", "NonNeg"},
            {ConstraintKind::MaxNorm, "max_norm", "MaxNorm"},
            {ConstraintKind::UnitNorm, "unit_norm", "UnitNorm"},
        }};

        template <typename E, size_t N>
        std::expected<E, std::string> lookup(const std::array<NameEntry<E>, N>& table,
                                             std::string_view name, std::string_view what) {
            const auto it = std::find_if(table.begin(), table.end(), [&](const auto& entry) {
                return entry.name == name || entry.class_name == name;
            });
            if (it == table.end()) {
                return std::unexpected(std::format("Invalid argument: unknown {} '{}'", what, name));
            }
            return it->value;
        }

        template <typename E, size_t N>
        const NameEntry<E>& entry_for(const std::array<NameEntry<E>, N>& table, E value) {
            return *std::find_if(table.begin(), table.end(), [&](const auto& entry) {
                return entry.value == value;
            });
        }

        // Accepts an int (applied to both axes) or a two-element array
        std::expected<std::array<int64_t, 2>, std::string> read_pair(const nlohmann::json& j, std::string_view key) {
            if (j.is_number_integer()) {
                const auto v = j.get<int64_t>();
                return std::array<int64_t, 2>{v, v};
            }
            if (j.is_array() && j.size() == 2 && j[0].is_number_integer() && j[1].is_number_integer()) {
                return std::array<int64_t, 2>{j[0].get<int64_t>(), j[1].get<int64_t>()};
            }
            return std::unexpected(std::format("Invalid argument: '{}' must be an int or a pair of ints, got {}",
                                               key, j.dump()));
        }

        nlohmann::json spec_json(std::string_view class_name, nlohmann::json config) {
            return {{"class_name", std::string(class_name)}, {"config", std::move(config)}};
        }

        // {"class_name": X, "config": {...}} or a bare "name" string
        std::expected<std::pair<std::string, nlohmann::json>, std::string> split_spec(const nlohmann::json& j,
                                                                                      std::string_view what) {
            if (j.is_string()) {
                return std::make_pair(j.get<std::string>(), nlohmann::json::object());
            }
            if (j.is_object() && j.contains("class_name") && j["class_name"].is_string()) {
                return std::make_pair(j["class_name"].get<std::string>(),
                                      j.value("config", nlohmann::json::object()));
            }
            return std::unexpected(std::format("Invalid argument: malformed {} spec {}", what, j.dump()));
        }
    } // namespace

    std::expected<PaddingMode, std::string> parse_padding_mode(std::string_view name) {
        return lookup(PADDING_NAMES, name, "padding mode");
    }

    std::string_view to_string(const PaddingMode mode) {
        return entry_for(PADDING_NAMES, mode).name;
    }

    std::expected<Activation, std::string> parse_activation(std::string_view name) {
        return lookup(ACTIVATION_NAMES, name, "activation");
    }

    std::string_view to_string(const Activation activation) {
        return entry_for(ACTIVATION_NAMES, activation).name;
    }

    std::expected<InitializerSpec::Kind, std::string> parse_initializer_kind(std::string_view name) {
        return lookup(INITIALIZER_NAMES, name, "initializer");
    }

    std::string_view to_string(const InitializerSpec::Kind kind) {
        return entry_for(INITIALIZER_NAMES, kind).name;
    }

    std::expected<ConstraintSpec::Kind, std::string> parse_constraint_kind(std::string_view name) {
        return lookup(CONSTRAINT_NAMES, name, "constraint");
    }

    std::string_view to_string(const ConstraintSpec::Kind kind) {
        return entry_for(CONSTRAINT_NAMES, kind).name;
    }

    nlohmann::json to_json(const InitializerSpec& spec) {
        nlohmann::json cfg = nlohmann::json::object();
        switch (spec.kind) {
        case InitKind::Constant:
            cfg["value"] = spec.value;
            break;
        case InitKind::RandomUniform:
            cfg["minval"] = spec.minval;
            cfg["maxval"] = spec.maxval;
            break;
        case InitKind::RandomNormal:
            cfg["mean"] = spec.mean;
            cfg["stddev"] = spec.stddev;
            break;
        default:
            break;
        }
        return spec_json(entry_for(INITIALIZER_NAMES, spec.kind).class_name, std::move(cfg));
    }

    nlohmann::json to_json(const std::optional<RegularizerSpec>& spec) {
        if (!spec)
            return nullptr;
        return spec_json("L1L2", {{"l1", spec->l1}, {"l2", spec->l2}});
    }

    nlohmann::json to_json(const std::optional<ConstraintSpec>& spec) {
        if (!spec)
            return nullptr;
        nlohmann::json cfg = nlohmann::json::object();
        if (spec->kind != ConstraintKind::NonNeg) {
            cfg["axis"] = spec->axis;
        }
        if (spec->kind == ConstraintKind::MaxNorm) {
            cfg["max_value"] = spec->max_value;
        }
        return spec_json(entry_for(CONSTRAINT_NAMES, spec->kind).class_name, std::move(cfg));
    }

    nlohmann::json to_json(const PadderConfig& config) {
        return {
            {"name", config.name},
            {"padding", config.padding},
            {"data_format", std::string(core::to_string(config.data_format))}};
    }

    nlohmann::json to_json(const ConvConfig& config) {
        return {
            {"name", config.name},
            {"filters", config.filters},
            {"kernel_size", config.kernel_size},
            {"strides", config.strides},
            {"padding", std::string(to_string(config.padding))},
            {"data_format", std::string(core::to_string(config.data_format))},
            {"dilation_rate", config.dilation_rate},
            {"activation", std::string(to_string(config.activation))},
            {"use_bias", config.use_bias},
            {"flip_north_pole", config.flip_north_pole},
            {"independent_north_pole", config.independent_north_pole},
            {"kernel_initializer", to_json(config.kernel_initializer)},
            {"bias_initializer", to_json(config.bias_initializer)},
            {"kernel_regularizer", to_json(config.kernel_regularizer)},
            {"bias_regularizer", to_json(config.bias_regularizer)},
            {"activity_regularizer", to_json(config.activity_regularizer)},
            {"kernel_constraint", to_json(config.kernel_constraint)},
            {"bias_constraint", to_json(config.bias_constraint)}};
    }

    std::expected<InitializerSpec, std::string> initializer_from_json(const nlohmann::json& j) {
        try {
            auto parts = split_spec(j, "initializer");
            if (!parts)
                return std::unexpected(parts.error());
            auto kind = parse_initializer_kind(parts->first);
            if (!kind)
                return std::unexpected(kind.error());

            const auto& cfg = parts->second;
            InitializerSpec spec{.kind = *kind};
            spec.value = cfg.value("value", spec.value);
            spec.minval = cfg.value("minval", spec.minval);
            spec.maxval = cfg.value("maxval", spec.maxval);
            spec.mean = cfg.value("mean", spec.mean);
            spec.stddev = cfg.value("stddev", spec.stddev);
            return spec;
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Invalid argument: bad initializer config: {}", e.what()));
        }
    }

    std::expected<std::optional<RegularizerSpec>, std::string> regularizer_from_json(const nlohmann::json& j) {
        if (j.is_null())
            return std::optional<RegularizerSpec>{};
        try {
            auto parts = split_spec(j, "regularizer");
            if (!parts)
                return std::unexpected(parts.error());

            const auto& [name, cfg] = *parts;
            RegularizerSpec spec;
            if (name == "L1L2" || name == "l1_l2") {
                spec.l1 = cfg.value("l1", 0.0);
                spec.l2 = cfg.value("l2", 0.0);
            } else if (name == "L1" || name == "l1") {
                spec.l1 = cfg.value("l1", 0.01);
            } else if (name == "L2" || name == "l2") {
                spec.l2 = cfg.value("l2", 0.01);
            } else {
                return std::unexpected(std::format("Invalid argument: unknown regularizer '{}'", name));
            }
            if (spec.l1 < 0.0 || spec.l2 < 0.0) {
                return std::unexpected("Invalid argument: regularization factors must be non-negative");
            }
            return std::optional<RegularizerSpec>{spec};
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Invalid argument: bad regularizer config: {}", e.what()));
        }
    }

    std::expected<std::optional<ConstraintSpec>, std::string> constraint_from_json(const nlohmann::json& j) {
        if (j.is_null())
            return std::optional<ConstraintSpec>{};
        try {
            auto parts = split_spec(j, "constraint");
            if (!parts)
                return std::unexpected(parts.error());
            auto kind = parse_constraint_kind(parts->first);
            if (!kind)
                return std::unexpected(kind.error());

            const auto& cfg = parts->second;
            ConstraintSpec spec{.kind = *kind};
            spec.max_value = cfg.value("max_value", spec.max_value);
            if (cfg.contains("axis")) {
                const auto& axis = cfg["axis"];
                spec.axis = axis.is_array() ? axis.get<std::vector<int64_t>>()
                                            : std::vector<int64_t>{axis.get<int64_t>()};
            }
            if (spec.max_value <= 0.0) {
                return std::unexpected("Invalid argument: max_norm constraint needs a positive max_value");
            }
            return std::optional<ConstraintSpec>{spec};
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Invalid argument: bad constraint config: {}", e.what()));
        }
    }

    std::expected<PadderConfig, std::string> padder_config_from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return std::unexpected(std::format("Invalid argument: padder config must be an object, got {}", j.dump()));
        }
        try {
            PadderConfig config;
            config.name = j.value("name", std::string{});

            if (j.contains("padding")) {
                // A pair must be uniform: the halo is the same on every edge
                auto pad = read_pair(j["padding"], "padding");
                if (!pad)
                    return std::unexpected(pad.error());
                if ((*pad)[0] != (*pad)[1]) {
                    return std::unexpected("Invalid argument: cube halo padding must be equal in height and width");
                }
                config.padding = (*pad)[0];
            }

            auto format = core::parse_data_format(j.value("data_format", std::string{"channels_first"}));
            if (!format)
                return std::unexpected(format.error());
            config.data_format = *format;
            return config;
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Invalid argument: bad padder config: {}", e.what()));
        }
    }

    std::expected<ConvConfig, std::string> conv_config_from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return std::unexpected(std::format("Invalid argument: convolution config must be an object, got {}", j.dump()));
        }
        if (!j.contains("filters") || !j.contains("kernel_size")) {
            return std::unexpected("Invalid argument: convolution config requires 'filters' and 'kernel_size'");
        }
        try {
            ConvConfig config;
            config.name = j.value("name", std::string{});
            config.filters = j["filters"].get<int64_t>();

            auto kernel = read_pair(j["kernel_size"], "kernel_size");
            if (!kernel)
                return std::unexpected(kernel.error());
            config.kernel_size = *kernel;

            if (j.contains("strides")) {
                auto strides = read_pair(j["strides"], "strides");
                if (!strides)
                    return std::unexpected(strides.error());
                config.strides = *strides;
            }
            if (j.contains("dilation_rate")) {
                auto dilation = read_pair(j["dilation_rate"], "dilation_rate");
                if (!dilation)
                    return std::unexpected(dilation.error());
                config.dilation_rate = *dilation;
            }

            auto padding = parse_padding_mode(j.value("padding", std::string{"valid"}));
            if (!padding)
                return std::unexpected(padding.error());
            config.padding = *padding;

            auto format = core::parse_data_format(j.value("data_format", std::string{"channels_first"}));
            if (!format)
                return std::unexpected(format.error());
            config.data_format = *format;

            // Keras writes no activation as null
            const auto& activation_json = j.contains("activation") ? j["activation"] : nlohmann::json{};
            auto activation = activation_json.is_null()
                                  ? std::expected<Activation, std::string>{Activation::Linear}
                                  : parse_activation(activation_json.get<std::string>());
            if (!activation)
                return std::unexpected(activation.error());
            config.activation = *activation;

            config.use_bias = j.value("use_bias", config.use_bias);
            config.flip_north_pole = j.value("flip_north_pole", config.flip_north_pole);
            config.independent_north_pole = j.value("independent_north_pole", config.independent_north_pole);

            if (j.contains("kernel_initializer") && !j["kernel_initializer"].is_null()) {
                auto init = initializer_from_json(j["kernel_initializer"]);
                if (!init)
                    return std::unexpected(init.error());
                config.kernel_initializer = *init;
            }
            if (j.contains("bias_initializer") && !j["bias_initializer"].is_null()) {
                auto init = initializer_from_json(j["bias_initializer"]);
                if (!init)
                    return std::unexpected(init.error());
                config.bias_initializer = *init;
            }

            const std::array<std::pair<const char*, std::optional<RegularizerSpec>*>, 3> regularizers{{
                {"kernel_regularizer", &config.kernel_regularizer},
                {"bias_regularizer", &config.bias_regularizer},
                {"activity_regularizer", &config.activity_regularizer},
            }};
            for (const auto& [key, target] : regularizers) {
                if (!j.contains(key))
                    continue;
                auto reg = regularizer_from_json(j[key]);
                if (!reg)
                    return std::unexpected(reg.error());
                *target = *reg;
            }

            const std::array<std::pair<const char*, std::optional<ConstraintSpec>*>, 2> constraints{{
                {"kernel_constraint", &config.kernel_constraint},
                {"bias_constraint", &config.bias_constraint},
            }};
            for (const auto& [key, target] : constraints) {
                if (!j.contains(key))
                    continue;
                auto constraint = constraint_from_json(j[key]);
                if (!constraint)
                    return std::unexpected(constraint.error());
                *target = *constraint;
            }

            LOG_TRACE("Parsed convolution config '{}' with {} filters", config.name, config.filters);
            return config;
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Invalid argument: bad convolution config: {}", e.what()));
        }
    }

} // namespace csn::config
