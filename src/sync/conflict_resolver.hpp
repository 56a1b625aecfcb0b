#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tidesync::sync {

enum class ResolutionStrategy {
    ServerWins,
    ClientWins,
    MostRecent,
    FieldLevelMerge,
    ThreeWayMerge,
    Manual
};

[[nodiscard]] std::string_view to_string(ResolutionStrategy strategy);
[[nodiscard]] std::optional<ResolutionStrategy> parse_strategy(std::string_view id);

/**
 * Resolution - what to do with a conflicting entity.
 *
 * `merged` is set only for Kind::Merge. `unresolved_fields` lists fields a
 * three-way merge could not decide; they carry the base value in `merged`.
 */
struct Resolution {
    enum class Kind {
        UseLocal,
        UseRemote,
        Merge,
        Manual
    };

    Kind kind{Kind::Manual};
    std::optional<Entity> merged;
    std::vector<std::string> unresolved_fields;

    [[nodiscard]] std::string_view description() const;
};

/**
 * ConflictResolver - applies the active strategy to a local/remote pair.
 *
 * Pure: it neither reads nor writes storage. The orchestrator persists the
 * outcome and the conflict history entry.
 */
class ConflictResolver {
public:
    using Clock = std::function<Timestamp()>;

    explicit ConflictResolver(ResolutionStrategy strategy = ResolutionStrategy::MostRecent,
                              Clock clock = &Timestamp::now)
        : strategy_(strategy), clock_(std::move(clock)) {}

    [[nodiscard]] ResolutionStrategy strategy() const { return strategy_; }
    void set_strategy(ResolutionStrategy strategy) { strategy_ = strategy; }

    /**
     * Resolve a conflict. `base` is the last state both sides agreed on;
     * without it ThreeWayMerge uses `local` as its own base.
     *
     * Fails with InvalidEntityType when the two sides are not of the same,
     * non-empty entity type, and with InvalidArguments when they are
     * different entities.
     */
    [[nodiscard]] Result<Resolution, Error> resolve(const Entity& local,
                                                    const Entity& remote,
                                                    const Entity* base = nullptr) const;

private:
    [[nodiscard]] Entity field_level_merge(const Entity& local, const Entity& remote) const;
    [[nodiscard]] Resolution three_way(const Entity& local, const Entity& remote, const Entity& base) const;

    ResolutionStrategy strategy_;
    Clock clock_;
};

} // namespace tidesync::sync
