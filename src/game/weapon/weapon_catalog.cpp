/// @file weapon_catalog.cpp
/// @brief Built-in weapon schemas and the YAML catalog loader.

#include "arc/game/weapon_catalog.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <vector>

#include "arc/foundation/config_manager.hpp"
#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::foundation::ConfigManager;
using arc::foundation::ErrorCode;
using arc::foundation::GameError;
using arc::foundation::GameResult;
using arc::foundation::LogCategory;

// ═══════════════════════════════════════════════════════════════════════════
// Built-in weapons
// ═══════════════════════════════════════════════════════════════════════════

WeaponSchema FiragleSchema() {
    WeaponSchema schema;
    schema.id = "firagle_staff";
    schema.name = "The Firagle";
    schema.description =
        "A legendary staff imbued with the essence of a volcano. "
        "It hurls condensed fire that explodes on impact.";
    schema.modelId = "firagle_staff";
    schema.projectileVisual = "fireball";
    schema.effectColor = 0xff8c00;

    schema.stats.damage = 40;
    schema.stats.chargeDuration = Milliseconds(250);
    schema.stats.dischargePeakDuration = Milliseconds(150);
    schema.stats.decayDuration = Milliseconds(800);
    schema.stats.payload = ProjectileStats{25, 3.0f, 15.0f};
    return schema;
}

WeaponSchema StaffOfStormsSchema() {
    WeaponSchema schema;
    schema.id = "staff_of_storms";
    schema.name = "Staff of Storms";
    schema.description =
        "A staff that channels the raw fury of a thunderstorm, instantly "
        "striking a foe and arcing to nearby enemies.";
    schema.modelId = "staff_of_storms";
    schema.effectColor = 0x9bbff2;

    schema.stats.damage = 35;
    schema.stats.chargeDuration = Milliseconds(150);
    schema.stats.dischargePeakDuration = Milliseconds(100);
    schema.stats.decayDuration = Milliseconds(200);
    schema.stats.payload = ChainStats{3, 10.0f, 0.65f};
    return schema;
}

// ═══════════════════════════════════════════════════════════════════════════
// Config loading
// ═══════════════════════════════════════════════════════════════════════════

namespace {

/// Reads "weapons.<id>.<field>" keys, remembering the first failure.
class SectionReader {
public:
    SectionReader(const ConfigManager& config, std::string_view id)
        : config_(config), prefix_("weapons." + std::string(id) + ".") {}

    template <typename T>
    void Read(std::string_view field, T& target) {
        if (error_) {
            return;
        }
        auto result = config_.getOr<T>(prefix_ + std::string(field), target);
        if (!result) {
            error_ = result.error();
            return;
        }
        target = result.value();
    }

    void ReadMs(std::string_view field, Milliseconds& target) {
        int64_t count = target.count();
        Read(field, count);
        target = Milliseconds(count);
    }

    void ReadColor(std::string_view field, uint32_t& target) {
        std::string text;
        Read(field, text);
        if (error_ || text.empty()) {
            return;
        }
        std::string_view digits = text;
        if (digits.front() == '#') {
            digits.remove_prefix(1);
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
        if (ec != std::errc() || ptr != digits.data() + digits.size() || value > 0xffffff) {
            error_ = GameError(ErrorCode::ConfigTypeMismatch,
                               "invalid colour '" + text + "'", prefix_ + std::string(field));
            return;
        }
        target = value;
    }

    [[nodiscard]] bool Has(std::string_view field) const {
        return config_.hasKey(prefix_ + std::string(field));
    }

    [[nodiscard]] const std::optional<GameError>& Error() const noexcept { return error_; }

private:
    const ConfigManager& config_;
    std::string prefix_;
    std::optional<GameError> error_;
};

std::optional<WeaponSchema> builtInSchema(std::string_view id) {
    if (id == "firagle_staff") {
        return FiragleSchema();
    }
    if (id == "staff_of_storms") {
        return StaffOfStormsSchema();
    }
    return std::nullopt;
}

GameResult<WeaponSchema> loadSchema(const ConfigManager& config, const std::string& id) {
    SectionReader reader(config, id);

    WeaponSchema schema;
    if (auto builtIn = builtInSchema(id)) {
        schema = std::move(*builtIn);
    } else {
        schema.id = id;
        schema.name = id;
        schema.modelId = id;
    }

    if (reader.Has("type")) {
        std::string type;
        reader.Read("type", type);
        if (type == weaponTypeName(WeaponType::Projectile)) {
            if (!schema.stats.Projectile()) {
                schema.stats.payload = ProjectileStats{};
            }
        } else if (type == weaponTypeName(WeaponType::HitscanChain)) {
            if (!schema.stats.Chain()) {
                schema.stats.payload = ChainStats{};
            }
        } else if (!reader.Error()) {
            return GameResult<WeaponSchema>::err(
                GameError(ErrorCode::InvalidWeaponType,
                          id + ": unknown weapon type '" + type + "'", id));
        }
    } else if (!builtInSchema(id)) {
        return GameResult<WeaponSchema>::err(
            GameError(ErrorCode::InvalidWeaponType,
                      id + ": weapon type is required", id));
    }

    reader.Read("name", schema.name);
    reader.Read("description", schema.description);
    reader.Read("model", schema.modelId);
    reader.ReadColor("color", schema.effectColor);
    reader.Read("damage", schema.stats.damage);
    reader.ReadMs("charge_ms", schema.stats.chargeDuration);
    reader.ReadMs("discharge_peak_ms", schema.stats.dischargePeakDuration);
    reader.ReadMs("decay_ms", schema.stats.decayDuration);

    if (auto* projectile = std::get_if<ProjectileStats>(&schema.stats.payload)) {
        reader.Read("projectile_visual", schema.projectileVisual);
        reader.Read("splash_damage", projectile->splashDamage);
        reader.Read("splash_radius", projectile->splashRadius);
        reader.Read("projectile_speed", projectile->projectileSpeed);
    } else if (auto* chain = std::get_if<ChainStats>(&schema.stats.payload)) {
        reader.Read("max_chain_targets", chain->maxChainTargets);
        reader.Read("chain_radius", chain->chainRadius);
        reader.Read("damage_falloff", chain->damageFalloff);
    }

    if (reader.Error()) {
        return GameResult<WeaponSchema>::err(*reader.Error());
    }
    return GameResult<WeaponSchema>::ok(std::move(schema));
}

} // namespace

WeaponCatalog WeaponCatalog::BuiltIn() {
    WeaponCatalog catalog;
    // Built-in schemas are valid by construction.
    for (const auto& schema : {FiragleSchema(), StaffOfStormsSchema()}) {
        catalog.schemas_.push_back(std::make_unique<const WeaponSchema>(schema));
    }
    return catalog;
}

GameResult<WeaponCatalog> WeaponCatalog::FromConfig(const ConfigManager& config) {
    if (!config.hasKey("inventory.weapons")) {
        ARC_LOG_INFO(LogCategory::Config, "no inventory.weapons key, using built-in weapons");
        return GameResult<WeaponCatalog>::ok(BuiltIn());
    }

    auto ids = config.get<std::vector<std::string>>("inventory.weapons");
    if (!ids) {
        return GameResult<WeaponCatalog>::err(ids.error());
    }

    WeaponCatalog catalog;
    for (const auto& id : ids.value()) {
        auto schema = loadSchema(config, id);
        if (!schema) {
            return GameResult<WeaponCatalog>::err(schema.error());
        }
        auto added = catalog.Add(std::move(schema).value());
        if (!added) {
            return GameResult<WeaponCatalog>::err(added.error());
        }
    }

    if (catalog.Empty()) {
        return GameResult<WeaponCatalog>::err(
            GameError(ErrorCode::EmptyInventory, "inventory.weapons lists no weapons",
                      "inventory.weapons"));
    }

    ARC_LOG_INFO(LogCategory::Config,
                 "loaded " + std::to_string(catalog.Size()) + " weapons from config");
    return GameResult<WeaponCatalog>::ok(std::move(catalog));
}

GameResult<void> WeaponCatalog::Add(WeaponSchema schema) {
    auto valid = ValidateWeaponStats(schema.id, schema.stats);
    if (!valid) {
        ARC_LOG_ERROR(LogCategory::Weapon, std::string(valid.error().message()));
        return valid;
    }
    if (Find(schema.id) != nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "duplicate weapon id: " + schema.id, schema.id));
    }
    schemas_.push_back(std::make_unique<const WeaponSchema>(std::move(schema)));
    return GameResult<void>::ok();
}

const WeaponSchema* WeaponCatalog::Find(std::string_view id) const {
    for (const auto& schema : schemas_) {
        if (schema->id == id) {
            return schema.get();
        }
    }
    return nullptr;
}

std::vector<const WeaponSchema*> WeaponCatalog::All() const {
    std::vector<const WeaponSchema*> result;
    result.reserve(schemas_.size());
    for (const auto& schema : schemas_) {
        result.push_back(schema.get());
    }
    return result;
}

} // namespace arc::game
