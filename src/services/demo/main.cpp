/// @file main.cpp
/// @brief Headless demo encounter.
///
/// Runs a scripted fight against spawning rock monsters: the player stands
/// at the origin, charges and releases the equipped staff at the nearest
/// enemy, swaps staves periodically and raises a ward on a cooldown.
/// Enemies walk straight at the player and attack on contact. Prints a
/// summary when the tick budget runs out, the player dies, or a signal
/// arrives.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "arc/arc.hpp"

namespace {

using arc::event::EventBus;
using arc::event::GameEvent;
using arc::event::WeaponFired;
using arc::foundation::ProjectileId;
using arc::game::AimFrame;
using arc::game::AnimationState;
using arc::game::BodyType;
using arc::game::CombatSession;
using arc::game::Milliseconds;
using arc::game::PhysicsWorld;
using arc::game::Vector3;

#ifndef ARC_DEFAULT_CONFIG_PATH
#define ARC_DEFAULT_CONFIG_PATH "config/arcstaff.yaml"
#endif

constexpr uint64_t kDefaultTicks = 60 * 60;
constexpr float kEnemySpeed = 1.5f;        // units per second
constexpr float kProjectileRadius = 0.3f;
constexpr float kProjectileRange = 120.0f;
const Vector3 kPlayerEye{0.0f, 1.6f, 0.0f};
const Vector3 kPlayerBody{0.0f, 0.9f, 0.0f};  // below the eye, so aim rays clear it

/// Aims from the player's eye at the closest live enemy body.
class NearestEnemyAim final : public arc::game::IAimSource {
public:
    AimFrame CurrentAim() const override {
        AimFrame frame;
        frame.cameraOrigin = kPlayerEye;
        frame.staffTip = kPlayerEye + Vector3{0.3f, -0.2f, -0.5f};
        if (auto target = nearestTarget()) {
            frame.direction = (*target - kPlayerEye).Normalized();
        }
        return frame;
    }

    void SetTargetPositions(std::vector<Vector3> positions) { targets_ = std::move(positions); }

private:
    std::optional<Vector3> nearestTarget() const {
        std::optional<Vector3> best;
        for (const auto& p : targets_) {
            if (!best || p.DistanceSquared(kPlayerEye) < best->DistanceSquared(kPlayerEye)) {
                best = p;
            }
        }
        return best;
    }

    std::vector<Vector3> targets_;
};

/// Straight-line flight of WEAPON_FIRED projectiles until they touch a body.
class ProjectileFlight {
public:
    struct Live {
        ProjectileId id;
        std::string weaponId;
        Vector3 position;
        Vector3 velocity;
        float travelled = 0.0f;
    };

    void Launch(const WeaponFired& fired) {
        live_.push_back(Live{fired.id, fired.weaponId, fired.start, fired.velocity, 0.0f});
    }

    void Step(float seconds, const PhysicsWorld& world, CombatSession& session) {
        std::vector<Live> stillFlying;
        for (auto& p : live_) {
            const Vector3 step = p.velocity * seconds;
            p.position += step;
            p.travelled += step.Length();

            std::optional<arc::game::BodyHit> struck;
            for (const auto& body : world.IntersectSphere(p.position, kProjectileRadius)) {
                if (body.type != BodyType::Player && body.type != BodyType::Fireball) {
                    struck = body;
                    break;
                }
            }

            if (struck) {
                session.OnProjectileImpact(
                    arc::game::ProjectileImpact{p.id, p.weaponId, p.position, *struck});
            } else if (p.travelled < kProjectileRange) {
                stillFlying.push_back(p);
            }
        }
        live_ = std::move(stillFlying);
    }

private:
    std::vector<Live> live_;
};

template <typename... Es>
void countChannels(EventBus& bus, std::map<std::string_view, uint64_t>& counts,
                   std::variant<Es...>* /*tag*/) {
    ((void)bus.Subscribe<Es>([&counts](const Es&) { ++counts[Es::kChannel]; }), ...);
}

} // namespace

int main(int argc, char* argv[]) {
    arc::service::SignalHandler signals;

    auto configPath = arc::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = ARC_DEFAULT_CONFIG_PATH;
    }

    arc::foundation::ConfigManager config;
    auto loadResult = arc::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = arc::game::GameSettings::FromConfig(config);
    if (!settings) {
        std::cerr << "Invalid settings: " << settings.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto catalog = arc::game::WeaponCatalog::FromConfig(config);
    if (!catalog) {
        std::cerr << "Invalid weapons: " << catalog.error().message() << "\n";
        return EXIT_FAILURE;
    }

    if (auto level = config.getOr<std::string>("log.level", "info"); level) {
        if (auto parsed = arc::foundation::parseLogLevel(level.value())) {
            auto& logger = arc::foundation::GameLogger::instance();
            for (std::size_t i = 0; i < arc::foundation::kLogCategoryCount; ++i) {
                logger.setCategoryLevel(static_cast<arc::foundation::LogCategory>(i), *parsed);
            }
        }
    }

    const uint64_t tickBudget = arc::service::parseUintArg(argc, argv, "--ticks")
                                    .value_or(kDefaultTicks);
    const bool realtime = arc::service::hasFlag(argc, argv, "--realtime");

    PhysicsWorld world;
    world.AddBody(BodyType::Player, kPlayerBody, 0.5f);

    NearestEnemyAim aim;

    arc::game::CombatCollaborators collaborators;
    collaborators.physics = &world;
    collaborators.aim = &aim;
    collaborators.bodies = &world;

    const uint32_t tickRate = settings.value().game.tickRate;
    auto created = CombatSession::Create(std::move(settings).value(),
                                         std::move(catalog).value(), collaborators);
    if (!created) {
        std::cerr << "Failed to start session: " << created.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto session = std::move(created).value();

    std::map<std::string_view, uint64_t> channelCounts;
    countChannels(session->Bus(), channelCounts, static_cast<GameEvent*>(nullptr));

    ProjectileFlight flight;
    session->Bus().Subscribe<WeaponFired>([&flight](const WeaponFired& e) { flight.Launch(e); });

    session->SetPlayerPosition(Vector3{0.0f, 0.0f, 0.0f});
    session->Start();

    const auto weapons = session->Catalog().All();
    std::size_t weaponIndex = 0;
    Milliseconds elapsed{0};
    Milliseconds lastWeaponSwap{0};
    Milliseconds lastWard{0};

    arc::service::GameLoop loop(tickRate);
    // Written by the loop thread, polled by main in realtime mode.
    std::atomic<bool> finished{false};

    loop.setTickCallback([&](Milliseconds dt) {
        if (session->Player().IsDead()) {
            finished.store(true);
            return;
        }
        elapsed += dt;
        const float seconds = static_cast<float>(dt.count()) / 1000.0f;

        // Enemies close in on the player and attack on contact.
        std::vector<Vector3> positions;
        for (const auto& body : world.IntersectSphere(kPlayerEye, 200.0f)) {
            if (body.type != BodyType::Enemy) {
                continue;
            }
            const Vector3 toPlayer = kPlayerEye - body.position;
            const float distance = toPlayer.Length();
            Vector3 next = body.position;
            if (distance > session->Settings().enemy.attackRange) {
                next += toPlayer.Normalized() * std::min(kEnemySpeed * seconds, distance);
            }
            if (auto handle = world.FindEnemyBody(body.enemyId)) {
                world.MoveBody(*handle, next);
            }
            positions.push_back(next);
            session->OnEnemyContact(body.enemyId, next.Distance(kPlayerEye));
        }
        aim.SetTargetPositions(std::move(positions));

        // Staff: charge, release at full charge, switch staves every 10 s.
        if (weapons.size() > 1 && elapsed - lastWeaponSwap >= Milliseconds(10'000)) {
            weaponIndex = (weaponIndex + 1) % weapons.size();
            if (auto equipped = session->Equip(weapons[weaponIndex]->id); !equipped) {
                std::cerr << "Equip failed: " << equipped.error().message() << "\n";
            }
            lastWeaponSwap = elapsed;
        }
        switch (session->Weapons().State()) {
            case AnimationState::Idle:
                session->BeginCharge();
                break;
            case AnimationState::Charged:
                session->ReleaseTrigger();
                break;
            case AnimationState::Charging:
            case AnimationState::Discharging:
            case AnimationState::Decay:
                break;
        }

        // Ward whenever the shield is down, at most every 15 s.
        if (session->Player().State().shield == 0 &&
            elapsed - lastWard >= Milliseconds(15'000)) {
            session->CastSpell(arc::game::GestureSpell::ProtectiveWard);
            lastWard = elapsed;
        }

        flight.Step(seconds, world, *session);
        session->Tick(dt);
        if (session->Player().IsDead()) {
            finished.store(true);
        }
    });

    if (realtime) {
        if (!loop.start()) {
            std::cerr << "Game loop already running\n";
            return EXIT_FAILURE;
        }
        while (!signals.shutdownRequested() && loop.tickCount() < tickBudget &&
               !finished.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        loop.stop();
    } else {
        while (!signals.shutdownRequested() && loop.tickCount() < tickBudget &&
               !finished.load()) {
            loop.tick();
        }
    }

    const auto& player = session->Player().State();
    std::cout << "arcstaff demo v" << arc::Version::string << "\n"
              << "  ticks:        " << loop.tickCount() << "\n"
              << "  simulated:    " << loop.simulatedTime().count() << " ms\n"
              << "  overruns:     " << loop.overrunCount() << "\n"
              << "  score:        " << player.score << "\n"
              << "  kills:        " << player.enemiesKilled << "\n"
              << "  health:       " << player.health << "/" << player.maxHealth << "\n"
              << "  shield:       " << player.shield << "/" << player.maxShield << "\n"
              << "  damage taken: " << player.damageTaken << "\n"
              << "  shots fired:  " << session->Weapons().ShotsFired() << "\n"
              << "  enemies left: " << session->Enemies().Size() << "\n"
              << "  outcome:      " << (player.isDead ? "defeated" : "survived") << "\n"
              << "  events:\n";
    for (const auto& [channel, count] : channelCounts) {
        std::cout << "    " << channel << ": " << count << "\n";
    }
    if (session->Bus().FailedDispatchCount() > 0) {
        std::cout << "  failed handlers: " << session->Bus().FailedDispatchCount() << "\n";
    }

    if (auto flushed = arc::foundation::GameLogger::instance().flush(); !flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
