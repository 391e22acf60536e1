#include "goal.hpp"

bool Goal::collide(const Rectangle &other) const
{
    if (!CheckCollisionRecs(this->region, other))
        return false;
    if (this->onCollide)
        this->onCollide();
    return true;
}
