#pragma once

#include <string>

namespace sketchbook {

class Scene;
class MotionSystem;
class GameObject;
enum class MeshKind : int;

class IGameEngine {
public:
    virtual ~IGameEngine() = default;

    virtual Scene& scene() noexcept = 0;
    virtual const Scene& scene() const noexcept = 0;

    virtual MotionSystem& motion() noexcept = 0;
    virtual const MotionSystem& motion() const noexcept = 0;

    virtual GameObject& createObject(const std::string& name, MeshKind meshKind) = 0;

    virtual void update(float deltaSeconds) = 0;
    [[nodiscard]] virtual float elapsed() const noexcept = 0;

    virtual void setPaused(bool value) noexcept = 0;
    [[nodiscard]] virtual bool paused() const noexcept = 0;
};

} // namespace sketchbook
