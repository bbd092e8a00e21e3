#ifndef PINGPONG_I_GAME_CONTROL_HPP
#define PINGPONG_I_GAME_CONTROL_HPP

/**
 * @brief Pause/resume handle given to collaborators that must not score
 *
 * Holders do not own the implementation; its lifetime is managed by
 * whoever wires the session together. Both calls are soft-guarded by the
 * implementation and may be issued from any game state.
 */
class IGameControl {
public:
    virtual ~IGameControl() = default;

    virtual void pauseGame() = 0;
    virtual void resumeGame() = 0;
};

#endif // PINGPONG_I_GAME_CONTROL_HPP
