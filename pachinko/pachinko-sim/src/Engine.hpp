// Ticket: 0007_drop_session_events
// Ticket: 0009_deferred_class_switch

#ifndef PACHINKO_ENGINE_HPP
#define PACHINKO_ENGINE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pachinko-sim/src/Board/BallClass.hpp"
#include "pachinko-sim/src/Board/BoardConfig.hpp"
#include "pachinko-sim/src/Board/WorldBuilder.hpp"
#include "pachinko-sim/src/Environment/WorldModel.hpp"
#include "pachinko-sim/src/Game/CollisionClassifier.hpp"
#include "pachinko-sim/src/Game/GameEvents.hpp"
#include "pachinko-sim/src/Game/StabilityController.hpp"

namespace pachinko_sim
{

/**
 * @brief Read-only view of the ball in flight
 */
struct BallSnapshot
{
  BodyId id{0};
  Coordinate position;
  Velocity velocity;
  double radius{0.0};
};

/**
 * @brief Top-level drop session orchestrator
 *
 * Owns the board world, the active ball class and the drop lifecycle
 * (Idle -> Dropping -> Landed -> Idle). Each tick runs the stability
 * controller, steps the world, classifies new contacts, resolves residual
 * overlaps, then dispatches the tick's events to the callbacks and, when
 * Config::queueEvents is set, the event queue.
 *
 * Invalid operations (drop while a ball is in flight, drop after destroy,
 * drop at a non-finite x) are ignored and logged at debug level.
 *
 * @note Not thread-safe. Several engines may coexist; they share nothing but
 * the "pachinko" logger.
 */
class Engine
{
public:
  struct Config
  {
    double tickMillis{1000.0 / 60.0};  // Fixed tick used by tick()
    double baseGravityScale{0.002};    // Multiplied by class speedMultiplier
    double launchSpeed{5.0};           // Initial vy [px/tick] at speed 1.0
    double launchSpread{2.0};          // Width of the seeded initial vx range
    bool queueEvents{false};           // Keep events for drainEvents()
    WorldModel::Config world{};
    StabilityController::Config stability{};
  };

  /**
   * @brief Build the board and select the initial ball class
   *
   * @param board Board layout
   * @param classes Ball class table
   * @param classId Initial class (unknown ids fall back to "default")
   * @param callbacks Host callbacks
   * @throws std::invalid_argument if board fails BoardConfig::validate()
   */
  Engine(BoardConfig board,
         BallClassTable classes,
         const std::string& classId,
         EngineCallbacks callbacks);

  /**
   * @brief Build the board with custom tuning
   * @throws std::invalid_argument if board or config.world is invalid
   */
  Engine(BoardConfig board,
         BallClassTable classes,
         const std::string& classId,
         EngineCallbacks callbacks,
         const Config& config);

  /**
   * @brief Drop a ball at @p x with a seed derived from x and the clock
   * @return true if a ball was created; false for NaN or infinite x
   */
  bool drop(double x);

  /**
   * @brief Drop a ball at @p x with an explicit seed (reproducible)
   *
   * Ignored unless the session is Idle with no ball and x is finite. x is
   * clamped into [dropMargin, width - dropMargin].
   *
   * @return true if a ball was created
   */
  bool drop(double x, uint32_t seed);

  /**
   * @brief Return to Idle from any state, removing the ball.
   *
   * Applies a class change queued while the ball was in flight.
   */
  void reset();

  /**
   * @brief Select the ball class for the next drop.
   *
   * Applied immediately when Idle with no ball, otherwise queued until the
   * next reset(). The gravity of a ball in flight never changes.
   */
  void setClass(const std::string& classId);

  /**
   * @brief Remove every body. drop() is ignored until rebuild().
   */
  void destroy();

  /**
   * @brief Rebuild the board after destroy() (or to start from a clean world)
   */
  void rebuild();

  /**
   * @brief Advance the simulation by @p dtMillis
   * @throws std::logic_error if called from inside an engine callback
   * @throws std::invalid_argument if dtMillis is not positive
   */
  void step(double dtMillis);

  /**
   * @brief Advance by one fixed tick (Config::tickMillis)
   */
  void tick();

  /**
   * @brief Take every queued event, oldest first
   *
   * Always empty unless Config::queueEvents is set. A host that enables the
   * queue must drain it; nothing else removes queued events.
   */
  std::vector<GameEvent> drainEvents();

  [[nodiscard]] SessionState getState() const
  {
    return state_;
  }

  [[nodiscard]] std::optional<BallSnapshot> getBall() const;

  [[nodiscard]] int getPegHitCount() const
  {
    return pegHitCount_;
  }

  [[nodiscard]] const StabilityState& getStabilityState() const
  {
    return stability_.getState();
  }

  /// @brief Corrections applied during the current (or last) drop
  [[nodiscard]] const std::vector<CorrectionRecord>& getCorrections() const
  {
    return stability_.getCorrections();
  }

  [[nodiscard]] uint64_t getTickCount() const
  {
    return tickCount_;
  }

  [[nodiscard]] const std::string& getActiveClass() const
  {
    return activeClassId_;
  }

  [[nodiscard]] const BallClassConfig& getActiveClassConfig() const
  {
    return classes_.lookup(activeClassId_);
  }

  [[nodiscard]] const std::optional<std::string>& getPendingClass() const
  {
    return pendingClassId_;
  }

  [[nodiscard]] const std::optional<LandingResult>& getLastLanding() const
  {
    return lastLanding_;
  }

  [[nodiscard]] const BoardLayout& getLayout() const
  {
    return layout_;
  }

  [[nodiscard]] const BoardConfig& getBoard() const
  {
    return board_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  [[nodiscard]] const WorldModel& getWorldModel() const
  {
    return world_;
  }

  [[nodiscard]] bool isDestroyed() const
  {
    return destroyed_;
  }

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  Engine(Engine&&) = delete;
  Engine& operator=(Engine&&) = delete;
  ~Engine() = default;

private:
  bool launch(double x, uint32_t seed, int64_t nonce);
  void applyClass(const std::string& classId);
  void removeBall();
  void land(std::size_t bucketIndex);
  void dispatch(const std::vector<GameEvent>& events);

  BoardConfig board_;
  BallClassTable classes_;
  EngineCallbacks callbacks_;
  Config config_;

  WorldModel world_;
  BoardLayout layout_;
  CollisionClassifier classifier_;
  StabilityController stability_;

  SessionState state_{SessionState::Idle};
  std::optional<BodyId> ballId_;
  std::string activeClassId_;
  std::optional<std::string> pendingClassId_;
  int pegHitCount_{0};
  std::optional<LandingResult> lastLanding_;

  std::vector<GameEvent> pendingEvents_;  // Produced by the current tick
  std::vector<GameEvent> eventQueue_;     // Waiting for drainEvents()

  uint64_t tickCount_{0};
  bool stepping_{false};
  bool destroyed_{false};
};

}  // namespace pachinko_sim

#endif  // PACHINKO_ENGINE_HPP
