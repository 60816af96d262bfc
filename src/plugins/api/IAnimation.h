/**
 * @file IAnimation.h
 * @brief Core plugin interface for CosmicLED animations
 *
 * All animations (built-in and loader-supplied) implement this interface.
 * The conductor calls render() once per cycle with a pooled FrameBuffer and
 * a RenderContext; animations never touch hardware.
 *
 * Animations write logical, row-major, pre-gamma, pre-brightness colors.
 * Gamma, brightness and wiring order are applied by the matrix driver.
 *
 * Example implementation:
 * @code
 * class PulseAnimation : public IAnimation {
 * public:
 *     bool init(RenderContext& ctx) override { (void)ctx; return true; }
 *
 *     bool render(render::FrameBuffer& frame, const RenderContext& ctx) override {
 *         uint8_t level = sin8(static_cast<uint8_t>(ctx.frameIndex * 2));
 *         fill_solid(frame.data(), frame.size(), CHSV(160, 255, level));
 *         return true;
 *     }
 *
 *     void cleanup() override { }
 *
 *     const AnimationMetadata& getMetadata() const override {
 *         static AnimationMetadata meta{"pulse", "Breathing blue",
 *                                       AnimationCategory::AMBIENT, 1};
 *         return meta;
 *     }
 * };
 * @endcode
 */

#pragma once

#include <cstdint>

#include "RenderContext.h"
#include "../../core/render/FrameBuffer.h"

namespace cosmicled {
namespace plugins {

/**
 * @brief Animation category for listing and filtering
 */
enum class AnimationCategory : uint8_t {
    UNCATEGORIZED = 0,
    AMBIENT,        // Slow colour flow
    GEOMETRIC,      // Radial, mirrored, mathematical
    WAVE,           // Summed sine fields
    SPARKLE,        // Random, stateful
    UTILITY         // Solid fills, test patterns
};

/**
 * @brief Animation metadata for registration
 */
struct AnimationMetadata {
    const char* name;           // Registry key (max 31 chars)
    const char* description;    // Brief description
    AnimationCategory category;
    uint8_t version;

    AnimationMetadata(const char* n = "unnamed",
                      const char* d = "",
                      AnimationCategory c = AnimationCategory::UNCATEGORIZED,
                      uint8_t v = 1)
        : name(n), description(d), category(c), version(v) {}
};

enum class AnimationParameterType : uint8_t {
    FLOAT = 0,
    INT             // Rounded to the nearest integer on set
};

/**
 * @brief Tunable parameter descriptor
 */
struct AnimationParameter {
    const char* name;           // Parameter name (used as key)
    const char* displayName;    // Label
    float minValue;
    float maxValue;
    float defaultValue;
    AnimationParameterType type;

    AnimationParameter(const char* n = "", const char* d = "",
                       float min = 0.0f, float max = 1.0f, float def = 0.5f,
                       AnimationParameterType t = AnimationParameterType::FLOAT)
        : name(n), displayName(d), minValue(min), maxValue(max), defaultValue(def), type(t) {}

    /// Clamp to [min, max]; INT parameters are rounded first
    float constrain(float value) const;
};

/**
 * @brief Core animation interface
 *
 * Thread safety: every method is called from the conductor thread. Plugin
 * switches are applied between frames, so init()/cleanup() never overlap
 * render().
 */
class IAnimation {
public:
    virtual ~IAnimation() = default;

    //--------------------------------------------------------------------------
    // Lifecycle Methods
    //--------------------------------------------------------------------------

    /**
     * @brief Prepare for rendering
     * @return false to refuse activation (the previous animation stays)
     */
    virtual bool init(RenderContext& ctx) = 0;

    /**
     * @brief Render one frame into the buffer
     * @param frame Zeroed buffer of ctx.pixelCount() pixels
     * @param ctx Frame index, timing, geometry and tuning
     * @return false to signal a failed frame
     *
     * Resizing or emptying the buffer is treated as a failed frame.
     */
    virtual bool render(render::FrameBuffer& frame, const RenderContext& ctx) = 0;

    /**
     * @brief Release animation state
     *
     * Called when switching away. The animation may be initialized again.
     */
    virtual void cleanup() = 0;

    //--------------------------------------------------------------------------
    // Metadata Methods
    //--------------------------------------------------------------------------

    virtual const AnimationMetadata& getMetadata() const = 0;

    //--------------------------------------------------------------------------
    // Optional Parameter Methods (override for custom parameters)
    //--------------------------------------------------------------------------

    virtual uint8_t getParameterCount() const { return 0; }

    virtual const AnimationParameter* getParameter(uint8_t index) const {
        (void)index;
        return nullptr;
    }

    /**
     * @brief Set a parameter value
     * @param name Parameter name
     * @param value New value (clamped to min/max, rounded for INT)
     * @return true if parameter was found and set
     */
    virtual bool setParameter(const char* name, float value) {
        (void)name;
        (void)value;
        return false;
    }

    /**
     * @return Current value or 0.0f if not found
     */
    virtual float getParameter(const char* name) const {
        (void)name;
        return 0.0f;
    }
};

} // namespace plugins
} // namespace cosmicled
