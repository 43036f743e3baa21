// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#pragma once

#include "config.hpp"

// Enumerations =============================================================
// annex _e to enumerations

// Shapeshift form of the druid. FORM_CASTER only exists while a buff cast
// (Gift of the Wild) is resolving.
enum form_e
{
  FORM_CAT = 0,
  FORM_BEAR,
  FORM_CASTER,
  FORM_MAX
};

enum resource_e
{
  RESOURCE_NONE = 0,
  RESOURCE_MANA,
  RESOURCE_RAGE,
  RESOURCE_ENERGY,
  RESOURCE_COMBO_POINT,
  RESOURCE_MAX
};

enum result_e
{
  RESULT_NONE = 0,
  RESULT_MISS,
  RESULT_GLANCE,
  RESULT_CRIT,
  RESULT_HIT,
  RESULT_MAX
};

// Actor attributes that effects and stat-weight perturbations can modify
enum stat_e
{
  STAT_NONE = 0,
  STAT_ATTACK_POWER,
  STAT_AGILITY,
  STAT_CRIT_CHANCE,
  STAT_HIT_CHANCE,
  STAT_MISS_CHANCE,
  STAT_EXPERTISE_RATING,
  STAT_HASTE_RATING,
  STAT_HASTE_MULTIPLIER,
  STAT_ARMOR_PEN_RATING,
  STAT_WEAPON_DAMAGE,
  STAT_MANA,
  STAT_INTELLECT,
  STAT_SPIRIT,
  STAT_MP5,
  STAT_MAX
};

enum effect_behavior_e
{
  EFFECT_FIXED_USE = 0,
  EFFECT_CHANCE_PROC,
  EFFECT_STACKING_PROC,
  EFFECT_REFRESHING_PROC,
  EFFECT_INSTANT_DAMAGE,
  EFFECT_BEHAVIOR_MAX
};

// Which successful attacks may roll a proc effect
enum proc_trigger_e
{
  PROC_TRIGGER_ANY = 0,
  PROC_TRIGGER_MANGLE,
  PROC_TRIGGER_CAT_MANGLE,
  PROC_TRIGGER_SHRED,
  PROC_TRIGGER_MAX
};

// How the aura enabling stack accumulation of a stacking proc comes up
enum aura_trigger_e
{
  AURA_ACTIVATED = 0,
  AURA_PROC
};

enum ability_e
{
  ABILITY_MELEE = 0,
  ABILITY_MANGLE_CAT,
  ABILITY_RAKE,
  ABILITY_SHRED,
  ABILITY_SAVAGE_ROAR,
  ABILITY_RIP,
  ABILITY_FEROCIOUS_BITE,
  ABILITY_FAERIE_FIRE_CAT,
  ABILITY_SHIFT_BEAR,
  ABILITY_MAUL,
  ABILITY_MANGLE_BEAR,
  ABILITY_LACERATE,
  ABILITY_SHIFT_CAT,
  ABILITY_GIFT_OF_THE_WILD,
  ABILITY_FAERIE_FIRE_BEAR,
  ABILITY_MAX
};

enum dot_e
{
  DOT_RIP = 0,
  DOT_RAKE,
  DOT_LACERATE,
  DOT_MAX
};

// Per-actor cooldown timers, stored as remaining time
enum cooldown_e
{
  COOLDOWN_TIGERS_FURY = 0,
  COOLDOWN_BERSERK,
  COOLDOWN_ENRAGE,
  COOLDOWN_MANGLE_BEAR,
  COOLDOWN_FAERIE_FIRE,
  COOLDOWN_RUNE,
  COOLDOWN_ILOTP,
  COOLDOWN_MAX
};
