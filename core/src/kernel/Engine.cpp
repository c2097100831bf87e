#include "kernel/Engine.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>
#include "kernel/Queries.h"
#include "kernel/Random.h"

WorldEngine::WorldEngine(const EngineConfig& cfg, WorldSetup setup)
    : cfg_(cfg), setup_(std::move(setup)), event_log_(cfg.eventLogCapacity), rng_(cfg.seed) {
    if (cfg.maxTicks == 0) {
        throw std::invalid_argument("maxTicks must be > 0 (got 0)");
    }
    if (cfg.ticksPerEpoch == 0) {
        throw std::invalid_argument("ticksPerEpoch must be > 0 (got 0)");
    }
    if (cfg.epochsPerEra == 0) {
        throw std::invalid_argument("epochsPerEra must be > 0 (got 0)");
    }
    if (!(cfg.targetEntitiesPerKind > 0.0)) {
        throw std::invalid_argument("targetEntitiesPerKind must be > 0 (got " +
                                    std::to_string(cfg.targetEntitiesPerKind) + ")");
    }
    if (!(cfg.maxPressureStep > 0.0)) {
        throw std::invalid_argument("maxPressureStep must be > 0 (got " +
                                    std::to_string(cfg.maxPressureStep) + ")");
    }
    if (cfg.growthWindow == 0) {
        throw std::invalid_argument("growthWindow must be > 0 (got 0)");
    }
    if (cfg.entityKinds.empty()) {
        throw std::invalid_argument("entityKinds must name at least one kind (got 0)");
    }
    if (setup_.eras.empty()) {
        throw std::invalid_argument("world setup must define at least one era (got 0)");
    }

    reset();
}

void WorldEngine::addTemplate(std::unique_ptr<GrowthTemplate> tmpl) {
    if (!tmpl) {
        throw std::invalid_argument("addTemplate called with a null template");
    }
    templates_.push_back(std::move(tmpl));
}

void WorldEngine::addSystem(std::unique_ptr<SimulationSystem> system) {
    if (!system) {
        throw std::invalid_argument("addSystem called with a null system");
    }
    systems_.push_back(std::move(system));
}

void WorldEngine::reset() {
    rng_.seed(cfg_.seed);
    graph_ = WorldGraph();
    graph_.setSchema(setup_.schema.get());
    event_log_.clear();
    event_log_.setCapacity(cfg_.eventLogCapacity);

    for (const auto& def : setup_.pressures) {
        auto it = setup_.initialPressures.find(def.id);
        graph_.pressures().set(def.id, it != setup_.initialPressures.end() ? it->second : def.initial);
    }

    const Era& first = setup_.eras.front();
    graph_.setCurrentEra(EraState{first.id, first.name});

    MutationBatch seed;
    seed.entities = setup_.entities;
    for (const auto& rel : setup_.relationships) {
        seed.relate(rel.kind, rel.src, rel.dst, rel.strength, rel.distance);
    }
    const CommitOutcome outcome = commitMutation(graph_, seed);
    graph_.pressures().applyPending();

    epoch_ = 0;
    epoch_target_ = 0;
    epoch_created_ = 0;
    tick_relationships_ = 0;
    budget_warned_ = false;
    system_relationships_.clear();
    system_warned_at_.clear();
    aborted_ = false;

    event_log_.logSpecial(0, first.id,
                          "World initialized: " + std::to_string(outcome.createdIds.size()) + " entities, " +
                              std::to_string(outcome.relationshipsCreated.size()) + " relationships");
}

const Era& WorldEngine::currentEra() const {
    return selectEra(epoch_, setup_.eras, cfg_.epochsPerEra);
}

bool WorldEngine::shouldContinue() const {
    if (aborted_) return false;
    if (graph_.tick() >= cfg_.maxTicks) return false;
    if (graph_.tick() / cfg_.ticksPerEpoch >= totalEpochs()) return false;
    const double capacity = cfg_.targetEntitiesPerKind * static_cast<double>(cfg_.entityKinds.size());
    return static_cast<double>(graph_.entityCount()) < capacity;
}

void WorldEngine::run() {
    while (shouldContinue()) {
        step();
    }
    if (aborted_) {
        std::cerr << "[WARN] Run aborted at tick " << graph_.tick() << "\n";
    }
}

void WorldEngine::stepN(int n) {
    for (int i = 0; i < n && !aborted_; ++i) {
        step();
    }
}

void WorldEngine::step() {
    if (graph_.tick() % cfg_.ticksPerEpoch == 0) {
        beginEpoch();
    }

    tick_relationships_ = 0;
    budget_warned_ = false;

    runSystems();
    runGrowth();
    graph_.pressures().applyPending();
    monitorGrowth();

    graph_.advanceTick();
    if (graph_.tick() % cfg_.ticksPerEpoch == 0) {
        endEpoch();
    }
}

void WorldEngine::beginEpoch() {
    epoch_ = static_cast<std::size_t>(graph_.tick() / cfg_.ticksPerEpoch);
    const Era& era = currentEra();
    const EraState previous = graph_.currentEra();
    if (era.id != previous.id) {
        graph_.setCurrentEra(EraState{era.id, era.name});
        event_log_.logSpecial(graph_.tick(), era.id, "Era transition: " + previous.name + " -> " + era.name);
        if (cfg_.verbose) {
            std::cerr << "[DEBUG] Tick " << graph_.tick() << ": entering era " << era.name << "\n";
        }
    }
    graph_.discoveryState().discoveriesThisEpoch = 0;
    epoch_created_ = 0;
    epoch_target_ = computeGrowthTarget();
}

void WorldEngine::endEpoch() {
    updatePressures();
    pruneAndConsolidate();

    if (cfg_.verbose) {
        const Metrics m = computeMetrics();
        std::cerr << "[DEBUG] Epoch " << epoch_ << " (" << m.era << ") done: " << m.entities << " entities, "
                  << m.relationships << " relationships, " << epoch_created_ << "/" << epoch_target_
                  << " grown\n";
    }
}

double WorldEngine::kindDeficit(const std::string& kind) const {
    const double have = static_cast<double>(graph_.getEntityCount(kind));
    return std::max(0.0, cfg_.targetEntitiesPerKind - have);
}

std::size_t WorldEngine::computeGrowthTarget() {
    double deficit = 0.0;
    for (const auto& kind : cfg_.entityKinds) {
        deficit += kindDeficit(kind);
    }
    if (deficit <= 0.0) {
        return TuningConstants::kMinGrowthTarget;
    }

    const std::size_t remainingEpochs = std::max<std::size_t>(1, totalEpochs() - std::min(epoch_, totalEpochs()));
    const double variance = randomRange(1.0 - TuningConstants::kGrowthVariance,
                                        1.0 + TuningConstants::kGrowthVariance, rng_);
    const double target = std::round(deficit / static_cast<double>(remainingEpochs) * variance);
    return static_cast<std::size_t>(std::clamp(target, static_cast<double>(TuningConstants::kMinGrowthTarget),
                                               static_cast<double>(TuningConstants::kMaxGrowthTarget)));
}

CommitOutcome WorldEngine::commit(const MutationBatch& batch) {
    std::size_t budget = std::numeric_limits<std::size_t>::max();
    if (cfg_.maxRelationshipsPerTick > 0) {
        budget = cfg_.maxRelationshipsPerTick > tick_relationships_ ? cfg_.maxRelationshipsPerTick - tick_relationships_
                                                                    : 0;
    }
    CommitOutcome outcome = commitMutation(graph_, batch, budget);
    tick_relationships_ += outcome.relationshipsCreated.size();
    if (outcome.budgetExhausted && !budget_warned_) {
        std::cerr << "[WARN] Relationship budget of " << cfg_.maxRelationshipsPerTick << " reached at tick "
                  << graph_.tick() << "\n";
        budget_warned_ = true;
    }
    return outcome;
}

void WorldEngine::runSystems() {
    const Era& era = currentEra();

    HistoryEvent event;
    event.tick = graph_.tick();
    event.era = era.id;
    event.type = HistoryEventType::Simulation;

    for (auto& system : systems_) {
        const double modifier = getSystemModifier(era, system->id());
        if (modifier <= 0.0) continue;

        CommitOutcome outcome;
        std::string description;
        try {
            SystemResult result = system->apply(graph_, modifier, rng_);
            if (result.empty()) continue;
            outcome = commit(result);
            description = std::move(result.description);
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] System " << system->id() << " failed at tick " << graph_.tick() << ": "
                      << e.what() << "\n";
            continue;
        }

        std::size_t& total = system_relationships_[system->id()];
        total += outcome.relationshipsCreated.size();
        if (total > TuningConstants::kAggressiveSystemRelationships) {
            auto it = system_warned_at_.find(system->id());
            if (it == system_warned_at_.end() ||
                graph_.tick() >= it->second + TuningConstants::kAggressiveWarnInterval) {
                std::cerr << "[WARN] System " << system->id() << " has created " << total
                          << " relationships; it may be too aggressive\n";
                system_warned_at_[system->id()] = graph_.tick();
            }
        }

        if (!event.description.empty()) event.description += "; ";
        event.description += description;
        event.entitiesCreated.insert(event.entitiesCreated.end(), outcome.createdIds.begin(),
                                     outcome.createdIds.end());
        event.relationshipsCreated.insert(event.relationshipsCreated.end(), outcome.relationshipsCreated.begin(),
                                          outcome.relationshipsCreated.end());
        event.entitiesModified.insert(event.entitiesModified.end(), outcome.modifiedIds.begin(),
                                      outcome.modifiedIds.end());
        epoch_created_ += outcome.createdIds.size();
    }

    if (!event.entitiesCreated.empty() || !event.relationshipsCreated.empty() || !event.entitiesModified.empty()) {
        event_log_.record(std::move(event));
    }
}

void WorldEngine::runGrowth() {
    if (templates_.empty()) return;

    const std::size_t remaining = epoch_target_ > epoch_created_ ? epoch_target_ - epoch_created_ : 0;
    if (remaining == 0) return;
    const std::size_t ticksLeft = cfg_.ticksPerEpoch - static_cast<std::size_t>(graph_.tick() % cfg_.ticksPerEpoch);
    const std::size_t tickTarget = (remaining + ticksLeft - 1) / ticksLeft;

    const Era& era = currentEra();
    std::vector<double> weights(templates_.size(), 0.0);
    for (std::size_t i = 0; i < templates_.size(); ++i) {
        const double eraWeight = getTemplateWeight(era, templates_[i]->id());
        if (eraWeight <= 0.0) continue;
        const double deficit = kindDeficit(templates_[i]->producesKind());
        weights[i] = eraWeight * (0.5 + (deficit + 1.0) / cfg_.targetEntitiesPerKind * TuningConstants::kDeficitWeight);
    }

    const auto attempts = static_cast<std::size_t>(static_cast<double>(tickTarget) * TuningConstants::kTemplateOversample);
    std::size_t created = 0;
    for (std::size_t attempt = 0; attempt < attempts && created < tickTarget; ++attempt) {
        const std::size_t index = weightedIndex(weights, rng_);
        if (index >= weights.size()) break;
        weights[index] = 0.0;   // without replacement
        GrowthTemplate& tmpl = *templates_[index];

        TemplateResult result;
        try {
            if (!tmpl.canApply(graph_, rng_)) continue;
            const auto targets = tmpl.findTargets(graph_);
            if (targets.empty()) continue;
            const Entity* target = pickRandom(targets, rng_);
            result = tmpl.expand(graph_, target, rng_);
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Template " << tmpl.id() << " failed at tick " << graph_.tick() << ": "
                      << e.what() << "\n";
            continue;
        }

        if (result.empty()) {
            if (cfg_.verbose) {
                std::cerr << "[DEBUG] " << tmpl.id() << ": " << result.description << "\n";
            }
            continue;
        }

        CommitOutcome outcome;
        try {
            outcome = commit(result);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Template " << tmpl.id() << " produced an invalid batch at tick "
                      << graph_.tick() << ": " << e.what() << "\n";
            continue;
        }
        created += outcome.createdIds.size();
        epoch_created_ += outcome.createdIds.size();

        HistoryEvent event;
        event.tick = graph_.tick();
        event.era = era.id;
        event.type = HistoryEventType::Growth;
        event.description = std::move(result.description);
        event.entitiesCreated = std::move(outcome.createdIds);
        event.relationshipsCreated = std::move(outcome.relationshipsCreated);
        event.entitiesModified = std::move(outcome.modifiedIds);
        event_log_.record(std::move(event));
    }
}

void WorldEngine::updatePressures() {
    const Era& era = currentEra();
    for (const auto& def : setup_.pressures) {
        const double growth = def.growth ? def.growth(graph_) : 0.0;
        double delta = (growth - def.decay) * getPressureModifier(era, def.id);
        delta = std::clamp(delta, -cfg_.maxPressureStep, cfg_.maxPressureStep);
        graph_.pressures().applyDelta(def.id, delta);
    }
}

void WorldEngine::pruneAndConsolidate() {
    const auto degree = buildDegreeTable(graph_);
    const std::uint64_t now = graph_.tick();

    std::vector<std::string> forgotten;
    std::vector<std::string> elders;
    for (const auto& [id, e] : graph_.entities()) {
        const std::uint64_t age = now - std::min(now, e.createdAt);
        auto it = degree.find(id);
        const std::size_t connections = it != degree.end() ? it->second : 0;
        if (age > TuningConstants::kPruneAge && connections < TuningConstants::kPruneMinConnections &&
            e.prominence != Prominence::Forgotten) {
            forgotten.push_back(id);
        }
        if (e.kind == "npc" && e.status == "alive" && age > TuningConstants::kNaturalDeathAge) {
            elders.push_back(id);
        }
    }

    for (const auto& id : forgotten) {
        graph_.updateEntity(id, EntityChanges().withProminence(Prominence::Forgotten));
    }
    std::size_t deaths = 0;
    for (const auto& id : elders) {
        if (chance(TuningConstants::kNaturalDeathChance, rng_)) {
            graph_.updateEntity(id, EntityChanges().withStatus("dead"));
            ++deaths;
        }
    }
    if (cfg_.verbose && (!forgotten.empty() || deaths > 0)) {
        std::cerr << "[DEBUG] Consolidation at tick " << now << ": " << forgotten.size() << " forgotten, "
                  << deaths << " natural deaths\n";
    }
}

void WorldEngine::monitorGrowth() {
    GrowthMetrics& metrics = graph_.growthMetrics();
    metrics.relationshipsPerTick.push_back(static_cast<std::int64_t>(tick_relationships_));
    while (metrics.relationshipsPerTick.size() > cfg_.growthWindow) {
        metrics.relationshipsPerTick.pop_front();
    }
    double sum = 0.0;
    for (auto n : metrics.relationshipsPerTick) sum += static_cast<double>(n);
    metrics.averageGrowthRate = sum / static_cast<double>(metrics.relationshipsPerTick.size());

    if (metrics.relationshipsPerTick.size() >= TuningConstants::kGrowthWarnMinSamples &&
        metrics.averageGrowthRate > TuningConstants::kGrowthWarnRate) {
        std::cerr << "[WARN] Relationship growth averaging " << metrics.averageGrowthRate << "/tick over the last "
                  << metrics.relationshipsPerTick.size() << " ticks\n";
    }
}

ValidationReport WorldEngine::validate() const {
    const StructureValidator validator = setup_.schema ? setup_.schema->structureValidator() : StructureValidator{};
    return validateWorld(graph_, validator);
}

WorldEngine::Metrics WorldEngine::computeMetrics() const {
    Metrics m;
    m.tick = graph_.tick();
    m.epoch = epoch_;
    m.era = graph_.currentEra().name;
    m.entities = graph_.entityCount();
    m.relationships = graph_.relationshipCount();
    for (const auto& rel : graph_.relationships()) {
        if (rel.status == RelationshipStatus::Historical) ++m.historicalRelationships;
    }
    m.averageGrowth = graph_.growthMetrics().averageGrowthRate;
    for (const auto& [id, e] : graph_.entities()) {
        ++m.entitiesByKind[e.kind];
    }
    m.pressures = graph_.pressures().values();
    return m;
}
