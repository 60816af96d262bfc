/**
 * @file AnimationRegistry.cpp
 * @brief Name -> animation registry implementation
 */

#include "AnimationRegistry.h"

#include <cstring>

#define CL_LOG_TAG "Registry"
#include "../utils/Log.h"

namespace cosmicled {
namespace plugins {

bool AnimationRegistry::add(std::unique_ptr<IAnimation> animation) {
    if (!animation) {
        return false;
    }

    const char* name = animation->getMetadata().name;
    if (name == nullptr || name[0] == '\0' ||
        strlen(name) >= limits::MAX_ANIMATION_NAME) {
        CL_LOGW("Rejected animation with invalid name");
        return false;
    }
    if (m_count >= limits::MAX_ANIMATIONS) {
        CL_LOGW("Registry full, '%s' not registered", name);
        return false;
    }
    if (find(name) != nullptr) {
        CL_LOGW("Duplicate animation '%s'", name);
        return false;
    }

    m_entries[m_count] = std::move(animation);
    m_count++;
    CL_LOGD("Registered '%s' (%u total)", name, m_count);
    return true;
}

IAnimation* AnimationRegistry::find(const char* name) const {
    if (name == nullptr) {
        return nullptr;
    }
    for (uint8_t i = 0; i < m_count; i++) {
        if (strcmp(m_entries[i]->getMetadata().name, name) == 0) {
            return m_entries[i].get();
        }
    }
    return nullptr;
}

IAnimation* AnimationRegistry::at(uint8_t index) const {
    return (index < m_count) ? m_entries[index].get() : nullptr;
}

} // namespace plugins
} // namespace cosmicled
