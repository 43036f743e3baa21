// ==========================================================================
// Dedmonwakeen's Raid DPS/TPS Simulator.
// Send questions to natehieter@gmail.com
// ==========================================================================

#include "stat_target.hpp"

#include <stdexcept>

#include "player/druid.hpp"
#include "util/util.hpp"

// apply_delta ==============================================================

void apply_delta( druid_t& p, stat_e stat, double amount )
{
  switch ( stat )
  {
    case STAT_ATTACK_POWER:
      p.attack_power += amount;
      p.recalculate_damage();
      break;

    case STAT_AGILITY:
      p.agility += amount;
      p.attack_power += p.config.ap_mod * amount;
      p.crit_chance += amount / AGILITY_PER_CRIT_PERCENT / 100.0;
      p.recalculate_damage();
      break;

    case STAT_CRIT_CHANCE:
      p.crit_chance += amount;
      break;

    case STAT_HIT_CHANCE:
      p.hit_chance += amount;
      p.calc_miss_chance();
      break;

    case STAT_MISS_CHANCE:
      p.miss_adjust += amount;
      p.calc_miss_chance();
      break;

    case STAT_EXPERTISE_RATING:
      p.expertise_rating += amount;
      p.calc_miss_chance();
      break;

    case STAT_HASTE_RATING:
      p.set_haste( p.haste_rating + amount, p.haste_multiplier );
      break;

    case STAT_HASTE_MULTIPLIER:
      if ( amount >= 0 )
        p.set_haste( p.haste_rating, p.haste_multiplier * ( 1 + amount ) );
      else
        p.set_haste( p.haste_rating, p.haste_multiplier / ( 1 - amount ) );
      break;

    case STAT_ARMOR_PEN_RATING:
      p.armor_pen_rating += amount;
      p.recalculate_damage();
      break;

    case STAT_WEAPON_DAMAGE:
      p.bonus_damage += amount;
      p.recalculate_damage();
      break;

    case STAT_MANA:
      p.mana_pool += amount;
      p.resources.max[ RESOURCE_MANA ] = p.mana_pool;
      if ( amount > 0 )
        p.resource_gain( RESOURCE_MANA, amount );
      else
        p.set_resource( RESOURCE_MANA, p.mana() );
      break;

    case STAT_INTELLECT:
      p.intellect += amount;
      p.set_mana_regen();
      break;

    case STAT_SPIRIT:
      p.spirit += amount;
      p.set_mana_regen();
      break;

    case STAT_MP5:
      p.mp5 += amount;
      p.set_mana_regen();
      break;

    default:
      throw std::invalid_argument( fmt::format( "Stat '{}' cannot be modified", util::stat_type_string( stat ) ) );
  }
}

void sc_format_to( const stat_delta_t& d, fmt::format_context::iterator out )
{
  fmt::format_to( out, "{}{:+g}", util::stat_type_string( d.stat ), d.amount );
}
