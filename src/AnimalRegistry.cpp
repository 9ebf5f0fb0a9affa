#include "AnimalRegistry.hpp"
#include "RecordSerializer.hpp"
#include <algorithm>
#include <chrono>

namespace VetCalc {

const std::vector<std::string>& InMemoryAnimalRegistry::speciesList() {
    static const std::vector<std::string> species = {"Dog", "Cat", "Horse", "Cattle", "Other"};
    return species;
}

std::string InMemoryAnimalRegistry::generateId() {
    std::string id;
    do {
        id = "animal-" + std::to_string(next_id_++);
    } while (find(id) != nullptr);
    return id;
}

bool InMemoryAnimalRegistry::upsert(AnimalProfile profile) {
    if (profile.name.empty() || !(profile.weight_kg > 0)) {
        return false;
    }

    const auto& species = speciesList();
    if (std::find(species.begin(), species.end(), profile.species) == species.end()) {
        profile.species = "Other";
    }

    if (profile.id.empty()) {
        profile.id = generateId();
    }
    profile.updated_at = RecordSerializer::formatTimestamp(std::chrono::system_clock::now());

    auto it = std::find_if(animals_.begin(), animals_.end(),
                           [&](const AnimalProfile& a) { return a.id == profile.id; });
    if (it != animals_.end()) {
        *it = profile;
    } else {
        animals_.push_back(profile);
    }
    return true;
}

bool InMemoryAnimalRegistry::remove(const std::string& id) {
    auto it = std::find_if(animals_.begin(), animals_.end(),
                           [&](const AnimalProfile& a) { return a.id == id; });
    if (it == animals_.end()) {
        return false;
    }
    animals_.erase(it);
    return true;
}

const AnimalProfile* InMemoryAnimalRegistry::find(const std::string& id) const {
    for (const auto& animal : animals_) {
        if (animal.id == id) {
            return &animal;
        }
    }
    return nullptr;
}

std::vector<AnimalProfile> InMemoryAnimalRegistry::list() const {
    return animals_;
}

} // namespace VetCalc
