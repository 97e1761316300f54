#include "Cultivar.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <array>

namespace GardenSim {

static const std::array<const char*, 5> STAGE_NAMES = {
    { "Seed", "Sprout", "Young", "Mature", "Harvestable" }
};

const char* getGrowthStageName(GrowthStage stage)
{
    return STAGE_NAMES[static_cast<size_t>(stage)];
}

GrowthStage stageForProgress(double progress)
{
    if (progress >= 1.0) return GrowthStage::HARVESTABLE;
    if (progress >= 0.8) return GrowthStage::MATURE;
    if (progress >= 0.5) return GrowthStage::YOUNG;
    if (progress >= 0.2) return GrowthStage::SPROUT;
    return GrowthStage::SEED;
}

double soilMultiplier(TileKind kind)
{
    return kind == TileKind::SOIL ? Cultivar::SOIL_GROWTH_BONUS : 1.0;
}

Cultivar::Cultivar(CultivarId id, const PlantType& type, const Vector2i& origin)
    : id_(id), type_(&type), origin_(origin), remaining_(type.growth_time)
{}

bool Cultivar::advance(double dt, double weatherMult, double fertilizerMult, TileKind originKind)
{
    if (isHarvestable() || dt <= 0.0) {
        return false;
    }

    const double rate = weatherMult * fertilizerMult * soilMultiplier(originKind);
    if (rate <= 0.0) {
        return false;
    }
    remaining_ = std::max(0.0, remaining_ - dt * rate);

    const GrowthStage previous = stage_;
    stage_ = remaining_ <= 0.0 ? GrowthStage::HARVESTABLE : stageForProgress(getProgress());

    if (stage_ != previous) {
        LoggingChannels::growth()->debug(
            "Cultivar {}: {} at {} advanced {} -> {}",
            id_,
            type_->name,
            origin_.toString(),
            getGrowthStageName(previous),
            getGrowthStageName(stage_));
        return true;
    }
    return false;
}

double Cultivar::getProgress() const
{
    if (type_->growth_time <= 0.0) {
        return 1.0;
    }
    return std::clamp(1.0 - remaining_ / type_->growth_time, 0.0, 1.0);
}

std::vector<Vector2i> Cultivar::occupiedTiles() const
{
    return GardenSim::occupiedTiles(type_->footprint, origin_);
}

void to_json(nlohmann::json& j, const Cultivar& cultivar)
{
    j = nlohmann::json{ { "id", cultivar.getId() },
                        { "type", cultivar.getType().name },
                        { "origin", cultivar.getOrigin() },
                        { "stage", getGrowthStageName(cultivar.getStage()) },
                        { "remaining", cultivar.getRemainingGrowthTime() },
                        { "progress", cultivar.getProgress() } };
}

} // namespace GardenSim
