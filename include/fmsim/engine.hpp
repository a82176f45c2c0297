#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <fmsim/action_queue.hpp>
#include <fmsim/ball.hpp>
#include <fmsim/config.hpp>
#include <fmsim/diagnostics.hpp>
#include <fmsim/events.hpp>
#include <fmsim/execution_error.hpp>
#include <fmsim/formation.hpp>
#include <fmsim/gk_sweeping.hpp>
#include <fmsim/log.hpp>
#include <fmsim/match_result.hpp>
#include <fmsim/offside_trap.hpp>
#include <fmsim/ownership.hpp>
#include <fmsim/roster.hpp>
#include <fmsim/setup_error.hpp>
#include <fmsim/tactics.hpp>
#include <fmsim/trace.hpp>

namespace fmsim {

struct PlayerState {
  PlayerIndex idx{0};
  std::string name;
  PositionKey position{PositionKey::CM};
  PositionRole role{PositionRole::Midfielder};
  Foot foot{Foot::Right};
  PlayerAttributes attr{};

  Coord10 pos{};
  Vec2 vel{};                  // m/s
  double stamina{1.0};         // 0..1
  TacticalGoal goal{};

  int yellow_cards{0};
  bool sent_off{false};
  bool removed{false};         // taken out by a scenario
  bool scripted{false};        // moves with its set velocity, makes no decisions
  bool is_user{false};

  bool active() const { return !sent_off && !removed; }
  TeamSide team() const { return team_of(idx); }
  int slot() const { return slot_of(idx); }
  double fatigue() const { return 1.0 - stamina; }
  // 5.5..9 m/s by pace, reduced when tired.
  double top_speed_mps() const;
};

enum class RestartKind : std::uint8_t { KickOff, ThrowIn, GoalKick, Corner, FreeKick };

const char* to_string(RestartKind k);

struct TeamState {
  TeamSide side{TeamSide::Home};
  std::string name;
  Formation formation{};
  TeamInstructions instructions{};
  DirectionContext dir{};
  DefensiveLine line{};
  GkState gk_state{GkState::Attentive};
};

class MatchEngine;

// Validates the plan and configuration, then sets up the kickoff.
// `logger` may be null; it must outlive the engine.
std::variant<MatchEngine, SetupError> create_match_engine(const MatchPlan& plan,
                                                          const EngineConfig& cfg = {},
                                                          log::Logger* logger = nullptr);

// Full match in one call. Returns the setup error if the plan is rejected.
std::variant<MatchResult, SetupError> simulate_match(const MatchPlan& plan,
                                                     const EngineConfig& cfg = {},
                                                     log::Logger* logger = nullptr);

// Owns the whole match state. Single threaded: one step() is one decision
// tick, physics substeps included.
class MatchEngine {
public:
  MatchEngine(MatchEngine&&) = default;
  MatchEngine& operator=(MatchEngine&&) = default;

  // Advance one tick. Returns false once the match has finished.
  bool step();
  void run_to_end();
  // Up to n ticks; returns how many ran.
  int run_ticks(int n);

  std::uint64_t tick() const { return tick_; }
  int minute() const;
  int half() const { return half_; }
  bool finished() const { return finished_; }

  const Score& score() const { return score_; }
  const Ball& ball() const { return ball_; }
  std::optional<PlayerIndex> ball_owner() const { return ball_.current_owner; }
  std::optional<TeamSide> possession_team() const;

  std::size_t player_count() const { return players_.size(); }
  // nullptr if idx is out of range.
  const PlayerState* player_by_index(PlayerIndex idx) const;
  const TeamState& team(TeamSide s) const { return teams_[static_cast<int>(s)]; }
  const DirectionContext& direction_for(TeamSide s) const { return team(s).dir; }

  const std::vector<MatchEvent>& events() const { return events_; }
  bool has_event(EventKind kind) const;
  bool has_event(std::string_view name) const;
  std::size_t event_count(EventKind kind, std::optional<TeamSide> team = std::nullopt) const {
    return count_events(events_, kind, team);
  }

  // Named live values (ball_speed_mps, possession_home, home_goals, ...).
  std::optional<double> metric(std::string_view name) const;

  const MatchStats& stats() const { return stats_.stats(); }
  const DiagnosticSink& diagnostics() const { return diag_; }
  const EngineConfig& config() const { return cfg_; }
  const std::optional<PositionTrace>& trace() const { return trace_; }
  const ActionQueue& actions() const { return actions_; }

  MatchResult result() const;

  // --- Scenario hooks. Coordinates are validated by the caller; values are
  // still clamped to the pitch here. False for an invalid index.
  bool set_player_position(PlayerIndex idx, const Coord10& pos);
  bool set_player_velocity(PlayerIndex idx, const Vec2& vel_mps);
  bool set_player_scripted(PlayerIndex idx, bool scripted);
  bool remove_player(PlayerIndex idx);
  void set_ball_state(const Coord10& pos, const Vec2& vel_mps, double vz_mps,
                      std::optional<PlayerIndex> owner);
  // Owner passes to a teammate on the next tick. False if `from` does not
  // have the ball or `to` is not an active teammate.
  bool force_pass(PlayerIndex from, PlayerIndex to);
  // Ball out of play with a restart for `team`, taken at `spot`.
  bool force_out_of_play(RestartKind kind, TeamSide team, const Coord10& spot);

private:
  friend std::variant<MatchEngine, SetupError> create_match_engine(const MatchPlan&, const EngineConfig&, log::Logger*);

  MatchEngine(const MatchPlan& plan, const EngineConfig& cfg, log::Logger* logger);

  struct PassInFlight {
    PlayerIndex passer{0};
    std::optional<PlayerIndex> receiver{};   // empty for crosses
    bool offside{false};
    Coord10 from{};
    Coord10 to{};
    std::uint64_t launched{0};
    std::array<bool, kPlayerCount> tried{};   // defenders that already went for it
  };
  struct ShotInFlight {
    PlayerIndex shooter{0};
    bool save_attempted{false};
    std::uint64_t launched{0};
    Coord10 crossing{};                       // flight line at the goal line
    bool on_target{false};
    std::array<bool, kPlayerCount> tried{};   // defenders that already tried a block
  };
  struct PendingRestart {
    RestartKind kind{RestartKind::KickOff};
    PlayerIndex taker{0};
  };

  // match flow
  void kickoff(TeamSide side);
  void half_time();
  void award_restart(RestartKind kind, TeamSide team, const Coord10& spot);
  bool check_goal_or_out();
  void score_goal(TeamSide scorers);
  bool try_block_shot();
  void check_keeper_save();

  // decisions
  void update_tactics();
  void decide_for_owner();
  std::optional<PlayerIndex> choose_receiver(PlayerIndex owner, bool allow_offside);
  double shot_quality(PlayerIndex shooter) const;
  double pass_value(PlayerIndex owner, PlayerIndex receiver) const;
  Coord10 dribble_target(PlayerIndex owner) const;
  Coord10 cross_target(TeamSide team);
  void execute_due_actions();
  void execute_pass(PlayerIndex from, PlayerIndex to);
  void execute_shot(PlayerIndex shooter);
  void execute_cross(PlayerIndex crosser, const Coord10& target);

  // movement
  void move_players();
  Coord10 player_target(const PlayerState& p) const;
  SweepingContext sweeping_context(TeamSide side) const;

  // ball control
  // A pass counts as live until it slows to a roll or runs out of time;
  // opponents only win a live pass through try_intercept_pass().
  bool pass_live() const;
  bool try_intercept_pass();
  void resolve_ball_ownership();
  bool may_claim_ball(const PlayerState& p) const;
  void take_possession(PlayerIndex idx);
  void handle_tackle(PlayerIndex winner, PlayerIndex loser);
  void first_touch(PlayerIndex receiver);
  void send_off(PlayerIndex idx);

  // helpers
  ErrorContext error_context(const PlayerState& p, double skill) const;
  double pressure_on(PlayerIndex idx) const;
  std::optional<PlayerIndex> nearest_player(TeamSide team, const Coord10& at, bool outfield_only,
                                            std::optional<PlayerIndex> exclude = std::nullopt) const;
  double second_last_defender_progress(TeamSide attacking) const;
  bool in_offside_position(PlayerIndex idx) const;
  double uniform();
  void emit(EventKind kind, TeamSide team, std::optional<PlayerIndex> player = std::nullopt,
            std::optional<PlayerIndex> other = std::nullopt);
  void record_frame();
  void after_kick(PlayerIndex kicker);

  template <typename... Args>
  void log_info(std::string_view fmt, Args&&... args) const {
    if (log_) log_->info(fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void log_debug(std::string_view fmt, Args&&... args) const {
    if (log_) log_->debug(fmt, std::forward<Args>(args)...);
  }

  EngineConfig cfg_{};
  log::Logger* log_{nullptr};
  std::uint64_t seed_{0};
  std::mt19937_64 rng_;
  ExecutionErrorModel error_model_{};
  double decision_quality_{1.0};

  std::array<TeamState, 2> teams_{};
  std::array<PlayerState, kPlayerCount> players_{};
  Ball ball_{};
  ActionQueue actions_{};

  std::vector<MatchEvent> events_;
  StatsSink stats_{};
  DiagnosticSink diag_{};
  std::optional<PositionTrace> trace_{};

  Score score_{};
  std::uint64_t tick_{0};
  int half_{1};
  bool finished_{false};

  std::optional<PlayerIndex> last_touch_{};
  std::optional<PlayerIndex> cooldown_player_{};
  std::uint64_t cooldown_until_{0};
  std::uint64_t protect_until_{0};
  std::array<std::uint64_t, kPlayerCount> touch_delay_until_{};
  std::optional<PassInFlight> pass_{};
  std::optional<ShotInFlight> shot_{};
  std::optional<PendingRestart> restart_{};
};

} // namespace fmsim
