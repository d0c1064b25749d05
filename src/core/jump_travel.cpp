#include "starlane/core/jump_travel.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "starlane/core/enum_strings.h"
#include "starlane/util/log.h"
#include "starlane/util/sorted_keys.h"

namespace starlane {
namespace {

constexpr double kTwoPi = 6.28318530717958647692;

std::string fmt1(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v;
  return ss.str();
}

std::string system_label(const SystemMap& systems, SystemId id) {
  auto it = systems.find(id);
  if (it != systems.end() && !it->second.name.empty()) return it->second.name;
  return "system " + std::to_string(id.value);
}

bool usable_status(JumpPointStatus s) { return s == JumpPointStatus::Active || s == JumpPointStatus::Mapped; }

JumpRequirements fail(JumpRequirements r, std::string reason) {
  r.can_jump = false;
  r.failure_reasons.push_back(std::move(reason));
  return r;
}

} // namespace

std::string jump_status_to_string(JumpStatus s) {
  switch (s) {
    case JumpStatus::Pending: return "pending";
    case JumpStatus::Preparing: return "preparing";
    case JumpStatus::Jumping: return "jumping";
    case JumpStatus::Completed: return "completed";
    case JumpStatus::Failed: return "failed";
    case JumpStatus::Cancelled: return "cancelled";
  }
  return "pending";
}

std::string travel_event_kind_to_string(TravelEventKind k) {
  switch (k) {
    case TravelEventKind::JumpExecuted: return "jump_executed";
    case TravelEventKind::ExecutionFailed: return "execution_failed";
    case TravelEventKind::JumpPointLost: return "jump_point_lost";
    case TravelEventKind::Arrived: return "arrived";
    case TravelEventKind::ArrivalFailed: return "arrival_failed";
  }
  return "jump_executed";
}

std::string JumpRequirements::summary() const {
  std::string out;
  for (const auto& r : failure_reasons) {
    if (!out.empty()) out += "; ";
    out += r;
  }
  return out;
}

TravelEngine::TravelEngine(const JumpConfig& cfg) : cfg_(cfg) {}

double TravelEngine::preparation_time(const Fleet& fleet, const JumpPoint& jp) const {
  const double ships = static_cast<double>(fleet.ships.size());
  const double instability = 1.0 - std::clamp(jp.stability, 0.0, 1.0);
  const double t = cfg_.preparation_base_s + cfg_.preparation_per_ship_s * ships +
                   cfg_.preparation_instability_penalty_s * instability;
  return std::max(cfg_.preparation_min_s, t);
}

JumpRequirements TravelEngine::calculate_jump_requirements(const Fleet& fleet, const JumpPoint& jp,
                                                           const ShipMap& ships,
                                                           const TechnologyQuery& tech) const {
  JumpRequirements req;

  const FleetShape all = summarize_fleet(fleet, ships);
  if (fleet.ships.empty() || all.ship_count == 0) return fail(std::move(req), "Fleet has no ships");
  req.min_ship_size = all.min_size_class;
  req.max_ship_size = all.max_size_class;

  if (!jp.is_accessible_by(fleet.faction_id)) return fail(std::move(req), "Jump point not accessible");
  if (!usable_status(jp.status)) {
    return fail(std::move(req), "Jump point status is " + jump_point_status_to_string(jp.status));
  }
  if (jp.survey_level < kMinTravelSurveyLevel) {
    return fail(std::move(req), "Jump point not surveyed (level " + std::to_string(jp.survey_level) + ", need " +
                                    std::to_string(kMinTravelSurveyLevel) + ")");
  }
  if (fleet.fuel_remaining < cfg_.min_fuel_to_jump) return fail(std::move(req), "Insufficient fleet fuel");

  if (all.jump_capable == 0) return fail(std::move(req), "No ships have jump drive capability");
  const FleetShape fitting = summarize_fleet(fleet, ships, &jp);
  if (fitting.jump_capable == 0) {
    return fail(std::move(req), "No jump-capable ship fits size limits " + std::to_string(jp.min_ship_size) +
                                    "-" + std::to_string(jp.max_ship_size));
  }
  req.has_jump_drive = true;

  if (!jp.tech_requirement.empty()) {
    req.tech_requirements.push_back(jp.tech_requirement);
    if (tech && !tech(fleet.faction_id, jp.tech_requirement)) {
      return fail(std::move(req), "Missing required technology: " + jp.tech_requirement);
    }
  }

  req.fuel_cost = jp.fuel_cost(all.total_mass_tons, all.ship_count, cfg_);
  req.travel_time = jp.travel_time(all.total_mass_tons, all.ship_count, cfg_);
  req.preparation_time = preparation_time(fleet, jp);

  if (req.fuel_cost > fleet.fuel_remaining) {
    return fail(std::move(req), "Insufficient fuel (need " + fmt1(req.fuel_cost) + ", have " +
                                    fmt1(fleet.fuel_remaining) + ")");
  }

  req.can_jump = true;
  return req;
}

CommandResult TravelEngine::initiate_jump_preparation(Fleet& fleet, const JumpPoint& jp, SystemId target_system,
                                                      double current_time, const ShipMap& ships,
                                                      const TechnologyQuery& tech) {
  if (has_active_phase(fleet.id)) return {false, "Fleet is already preparing for or executing a jump"};

  const JumpRequirements req = calculate_jump_requirements(fleet, jp, ships, tech);
  if (!req.can_jump) return {false, "Jump not possible: " + req.summary()};

  JumpPreparation prep;
  prep.fleet_id = fleet.id;
  prep.jump_point_id = jp.id;
  prep.origin_system_id = fleet.system_id;
  prep.target_system_id = target_system;
  prep.start_time = current_time;
  prep.preparation_time = req.preparation_time;
  prep.fuel_cost = req.fuel_cost;
  prep.travel_time = req.travel_time;
  prep.status = JumpStatus::Pending;
  phases_.emplace(fleet.id, prep);

  fleet.status = FleetStatus::FormingUp;
  fleet.current_orders.push_back("Preparing jump via " + jp.name);

  log::info("Fleet " + fleet.name + " preparing jump via " + jp.name + " (" + fmt1(req.preparation_time) +
            " s, fuel " + fmt1(req.fuel_cost) + ")");
  return {true, "Jump preparation started - ready in " + fmt1(req.preparation_time) + " seconds"};
}

CommandResult TravelEngine::execute_jump(Fleet& fleet, JumpPoint& jp, double current_time, util::Rng& rng) {
  auto it = phases_.find(fleet.id);
  if (it == phases_.end()) return {false, "Fleet has no jump preparation"};
  auto* prep = std::get_if<JumpPreparation>(&it->second);
  if (!prep) return {false, "Fleet is already in transit"};
  if (prep->jump_point_id != jp.id) return {false, "Preparation is for a different jump point"};
  if (prep->progress < 1.0) return {false, "Fleet is not ready to jump"};

  if (!usable_status(jp.status)) {
    return {false, "Jump point status is " + jump_point_status_to_string(jp.status)};
  }
  if (fleet.fuel_remaining < prep->fuel_cost) return {false, "Insufficient fuel for jump"};

  const double jitter = rng.uniform(1.0 - cfg_.travel_time_jitter, 1.0 + cfg_.travel_time_jitter);

  JumpOperation op;
  op.fleet_id = fleet.id;
  op.origin_system_id = prep->origin_system_id.valid() ? prep->origin_system_id : fleet.system_id;
  op.target_system_id = prep->target_system_id;
  op.jump_point_id = jp.id;
  op.start_time = current_time;
  op.travel_time = prep->travel_time * jitter;
  op.fuel_consumed = prep->fuel_cost;
  op.status = JumpStatus::Jumping;

  fleet.fuel_remaining -= op.fuel_consumed;
  fleet.status = FleetStatus::InTransit;
  fleet.current_orders.push_back("Jumping to system " + std::to_string(op.target_system_id.value));

  jp.traffic_level += 1;
  jp.last_transit = current_time;

  const double travel = op.travel_time;
  it->second = op;

  log::info("Fleet " + fleet.name + " jumped via " + jp.name + " (ETA " + fmt1(travel) + " s)");
  return {true, "Jump executed - ETA: " + fmt1(travel) + " seconds"};
}

TravelEvent TravelEngine::complete_preparation(Fleet& fleet, SystemMap& systems, double current_time,
                                               util::Rng& rng) {
  TravelEvent ev;
  ev.fleet_id = fleet.id;

  auto it = phases_.find(fleet.id);
  auto* prep = (it == phases_.end()) ? nullptr : std::get_if<JumpPreparation>(&it->second);
  if (!prep) {
    ev.kind = TravelEventKind::ExecutionFailed;
    ev.message = "Fleet has no jump preparation";
    return ev;
  }
  prep->status = JumpStatus::Preparing;
  ev.origin_system_id = prep->origin_system_id;
  ev.target_system_id = prep->target_system_id;
  ev.jump_point_id = prep->jump_point_id;

  JumpPoint* jp = nullptr;
  if (auto sit = systems.find(prep->origin_system_id); sit != systems.end()) {
    jp = find_jump_point(sit->second, prep->jump_point_id);
  }
  if (!jp) {
    for (SystemId sid : util::sorted_keys(systems)) {
      jp = find_jump_point(systems.at(sid), prep->jump_point_id);
      if (jp) break;
    }
  }

  auto abort = [&](TravelEventKind kind, std::string msg) {
    prep->status = JumpStatus::Failed;
    phases_.erase(it);
    fleet.status = FleetStatus::Idle;
    fleet.current_orders.clear();
    log::warn("Fleet " + fleet.name + ": " + msg);
    ev.kind = kind;
    ev.message = std::move(msg);
    return ev;
  };

  if (!jp) return abort(TravelEventKind::JumpPointLost, "Jump point not found");

  CommandResult r = execute_jump(fleet, *jp, current_time, rng);
  if (!r.ok) return abort(TravelEventKind::ExecutionFailed, "Jump execution failed: " + r.message);

  ev.kind = TravelEventKind::JumpExecuted;
  ev.message = r.message;
  return ev;
}

std::vector<TravelEvent> TravelEngine::process_jump_operations(FleetMap& fleets, SystemMap& systems,
                                                               double current_time, double delta_seconds,
                                                               util::Rng& rng) {
  std::vector<TravelEvent> events;
  const double dt = std::max(0.0, delta_seconds);

  // Operations created by this tick's preparations start advancing next tick.
  std::vector<FleetId> in_transit;
  std::vector<FleetId> preparing;
  for (FleetId fid : util::sorted_keys(phases_)) {
    if (std::holds_alternative<JumpOperation>(phases_.at(fid))) {
      in_transit.push_back(fid);
    } else {
      preparing.push_back(fid);
    }
  }

  for (FleetId fid : preparing) {
    auto fit = fleets.find(fid);
    if (fit == fleets.end()) {
      log::debug("Dropping jump preparation for missing fleet " + std::to_string(fid.value));
      phases_.erase(fid);
      continue;
    }

    auto& prep = std::get<JumpPreparation>(phases_.at(fid));
    prep.progress = prep.preparation_time > 0.0 ? std::min(1.0, prep.progress + dt / prep.preparation_time) : 1.0;
    if (prep.progress < 1.0) continue;

    events.push_back(complete_preparation(fit->second, systems, current_time, rng));
  }

  for (FleetId fid : in_transit) {
    auto fit = fleets.find(fid);
    if (fit == fleets.end()) {
      log::debug("Dropping jump operation for missing fleet " + std::to_string(fid.value));
      phases_.erase(fid);
      continue;
    }

    auto& op = std::get<JumpOperation>(phases_.at(fid));
    op.progress = op.travel_time > 0.0 ? std::min(1.0, op.progress + dt / op.travel_time) : 1.0;
    if (op.progress < 1.0) continue;

    events.push_back(complete_jump(fit->second, op, systems, current_time, rng));
    phases_.erase(fid);
  }
  return events;
}

TravelEvent TravelEngine::complete_jump(Fleet& fleet, JumpOperation& op, SystemMap& systems, double current_time,
                                        util::Rng& rng) {
  TravelEvent ev;
  ev.fleet_id = fleet.id;
  ev.origin_system_id = op.origin_system_id;
  ev.target_system_id = op.target_system_id;
  ev.jump_point_id = op.jump_point_id;

  fleet.velocity_km_s = Vec3{};
  fleet.destination.reset();
  fleet.estimated_arrival.reset();
  fleet.status = FleetStatus::Idle;
  fleet.current_orders.clear();

  auto sit = systems.find(op.target_system_id);
  if (sit == systems.end()) {
    op.status = JumpStatus::Failed;
    record_history(op, current_time);
    log::error("Fleet " + fleet.name + " could not arrive: target system " +
               std::to_string(op.target_system_id.value) + " no longer exists");
    ev.kind = TravelEventKind::ArrivalFailed;
    ev.message = "Jump completion failed: target system missing";
    return ev;
  }
  const StarSystem& target = sit->second;

  const JumpPoint* reciprocal = nullptr;
  for (const auto& jp : target.jump_points) {
    if (jp.connects_to == op.origin_system_id) {
      reciprocal = &jp;
      break;
    }
  }

  const double bearing = rng.uniform(0.0, kTwoPi);
  if (reciprocal) {
    const double r = cfg_.arrival_offset_km;
    fleet.position_km = reciprocal->position_km + Vec3{r * std::cos(bearing), r * std::sin(bearing), 0.0};
  } else {
    const double r = rng.uniform(0.0, cfg_.arrival_offset_km);
    fleet.position_km = Vec3{r * std::cos(bearing), r * std::sin(bearing), 0.0};
  }
  fleet.system_id = target.id;

  op.status = JumpStatus::Completed;
  record_history(op, current_time);

  log::info("Fleet " + fleet.name + " arrived in " + target.name);
  ev.kind = TravelEventKind::Arrived;
  ev.message = "Jump to " + system_label(systems, target.id) + " completed";
  return ev;
}

void TravelEngine::record_history(const JumpOperation& op, double arrival_time) {
  JumpHistoryEntry e;
  e.origin_system_id = op.origin_system_id;
  e.target_system_id = op.target_system_id;
  e.jump_point_id = op.jump_point_id;
  e.start_time = op.start_time;
  e.travel_time = op.travel_time;
  e.fuel_consumed = op.fuel_consumed;
  e.arrival_time = arrival_time;
  e.status = op.status;

  auto& h = history_[op.fleet_id];
  h.push_back(e);
  const std::size_t cap = static_cast<std::size_t>(std::max(1, cfg_.max_history_entries));
  while (h.size() > cap) h.pop_front();
}

CommandResult TravelEngine::cancel_jump_operation(Fleet& fleet) {
  auto it = phases_.find(fleet.id);
  if (it == phases_.end()) return {false, "No active jump operation to cancel"};
  if (std::holds_alternative<JumpOperation>(it->second)) return {false, "Cannot cancel jump in progress"};

  std::get<JumpPreparation>(it->second).status = JumpStatus::Cancelled;
  phases_.erase(it);

  fleet.status = FleetStatus::Idle;
  fleet.current_orders.clear();
  log::info("Fleet " + fleet.name + " cancelled its jump preparation");
  return {true, "Jump preparation cancelled"};
}

JumpStatusView TravelEngine::get_jump_status(FleetId fleet) const {
  JumpStatusView v;
  auto it = phases_.find(fleet);
  if (it == phases_.end()) return v;

  v.has_operation = true;
  if (const auto* prep = std::get_if<JumpPreparation>(&it->second)) {
    v.phase = JumpPhaseKind::Preparation;
    v.status = prep->status;
    v.progress = prep->progress;
    v.remaining_time = std::max(0.0, prep->preparation_time * (1.0 - prep->progress));
    v.origin_system_id = prep->origin_system_id;
    v.target_system_id = prep->target_system_id;
    v.jump_point_id = prep->jump_point_id;
    v.fuel = prep->fuel_cost;
  } else {
    const auto& op = std::get<JumpOperation>(it->second);
    v.phase = JumpPhaseKind::Transit;
    v.status = op.status;
    v.progress = op.progress;
    v.remaining_time = std::max(0.0, op.travel_time * (1.0 - op.progress));
    v.origin_system_id = op.origin_system_id;
    v.target_system_id = op.target_system_id;
    v.jump_point_id = op.jump_point_id;
    v.fuel = op.fuel_consumed;
  }
  return v;
}

std::vector<JumpHistoryEntry> TravelEngine::get_jump_history(FleetId fleet, int limit) const {
  auto it = history_.find(fleet);
  if (it == history_.end()) return {};
  const auto& h = it->second;

  std::size_t start = 0;
  if (limit > 0 && h.size() > static_cast<std::size_t>(limit)) start = h.size() - static_cast<std::size_t>(limit);
  return {h.begin() + static_cast<std::ptrdiff_t>(start), h.end()};
}

std::vector<AvailableJump> TravelEngine::get_available_jumps(const Fleet& fleet, const StarSystem& sys,
                                                             const ShipMap& ships,
                                                             const TechnologyQuery& tech) const {
  std::vector<AvailableJump> out;
  for (const auto& jp : sys.jump_points) {
    if (!jp.is_accessible_by(fleet.faction_id)) continue;

    AvailableJump a;
    a.jump_point_id = jp.id;
    a.jump_point_name = jp.name;
    a.target_system_id = jp.connects_to;
    a.jump_point_status = jp.status;
    a.stability = jp.stability;
    a.size_class = jp.size_class;
    a.requirements = calculate_jump_requirements(fleet, jp, ships, tech);
    out.push_back(std::move(a));
  }
  return out;
}

const JumpPreparation* TravelEngine::preparation(FleetId fleet) const {
  auto it = phases_.find(fleet);
  return it == phases_.end() ? nullptr : std::get_if<JumpPreparation>(&it->second);
}

const JumpOperation* TravelEngine::operation(FleetId fleet) const {
  auto it = phases_.find(fleet);
  return it == phases_.end() ? nullptr : std::get_if<JumpOperation>(&it->second);
}

} // namespace starlane
