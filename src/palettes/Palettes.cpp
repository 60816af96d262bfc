/**
 * @file Palettes.cpp
 * @brief Built-in palette definitions
 *
 * Seven FastLED stock palettes plus two gradients tuned for dark-room
 * matrix panels.
 */

#include "Palettes.h"

// =============================================================================
// GRADIENT DEFINITIONS
// =============================================================================

// Deep violet through magenta to a cyan core
DEFINE_GRADIENT_PALETTE(cosmic_nebula_gp){
  0,   8,   0,  24,
  64,  72,   0, 120,
  128, 200,  16, 140,
  192,  24, 120, 200,
  255,  0, 220, 255
};

// Ember: black body ramp without the white tip
DEFINE_GRADIENT_PALETTE(ember_glow_gp){
  0,   0,   0,   0,
  96, 120,  10,   0,
  176, 230,  70,   0,
  255, 255, 170,  20
};

namespace cosmicled {
namespace palettes {

CRGBPalette16 getPalette(uint8_t index) {
    switch (index) {
        case 0: return CRGBPalette16(RainbowColors_p);
        case 1: return CRGBPalette16(OceanColors_p);
        case 2: return CRGBPalette16(LavaColors_p);
        case 3: return CRGBPalette16(ForestColors_p);
        case 4: return CRGBPalette16(PartyColors_p);
        case 5: return CRGBPalette16(CloudColors_p);
        case 6: return CRGBPalette16(HeatColors_p);
        case 7: return CRGBPalette16(cosmic_nebula_gp);
        case 8: return CRGBPalette16(ember_glow_gp);
        default: return CRGBPalette16(RainbowColors_p);
    }
}

} // namespace palettes
} // namespace cosmicled
