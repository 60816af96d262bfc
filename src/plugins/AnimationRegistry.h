/**
 * @file AnimationRegistry.h
 * @brief Name -> animation registry consumed by the conductor
 *
 * The registry owns its animations. It is populated by a loader before the
 * conductor starts (registerBuiltinAnimations() for the compiled-in set);
 * the core never performs discovery itself.
 *
 * Append-only fixed table of limits::MAX_ANIMATIONS entries.
 */

#pragma once

#include "api/IAnimation.h"
#include "../config/limits.h"

#include <memory>
#include <stdint.h>

namespace cosmicled {
namespace plugins {

class AnimationRegistry {
public:
    AnimationRegistry() = default;
    AnimationRegistry(const AnimationRegistry&) = delete;
    AnimationRegistry& operator=(const AnimationRegistry&) = delete;

    /**
     * @brief Register an animation under getMetadata().name
     * @return false if the table is full, the name is empty/too long, or
     *         the name is already taken
     */
    bool add(std::unique_ptr<IAnimation> animation);

    /**
     * @brief Look up by name
     * @return Animation or nullptr if not registered
     */
    IAnimation* find(const char* name) const;

    bool contains(const char* name) const { return find(name) != nullptr; }

    /**
     * @brief Animation by registration order
     * @return nullptr if index >= count()
     */
    IAnimation* at(uint8_t index) const;

    uint8_t count() const { return m_count; }

private:
    std::unique_ptr<IAnimation> m_entries[limits::MAX_ANIMATIONS];
    uint8_t m_count = 0;
};

} // namespace plugins
} // namespace cosmicled
