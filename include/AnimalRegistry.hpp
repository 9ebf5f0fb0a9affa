#ifndef ANIMAL_REGISTRY_HPP
#define ANIMAL_REGISTRY_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace VetCalc {

/**
 * @brief Patient record used to pre-fill the dose weight
 */
struct AnimalProfile {
    std::string id;
    std::string name;
    std::string species = "Dog";
    double weight_kg = 0.0;
    std::string condition;
    std::string updated_at;     // ISO-8601, stamped on upsert
};

/**
 * @brief Read access to the patient collection
 */
class AnimalDirectory {
public:
    virtual ~AnimalDirectory() = default;

    /**
     * @return Pointer to the profile, or nullptr if not found
     */
    virtual const AnimalProfile* find(const std::string& id) const = 0;

    virtual std::vector<AnimalProfile> list() const = 0;
};

/**
 * @brief Patient collection kept in process memory
 */
class InMemoryAnimalRegistry : public AnimalDirectory {
public:
    InMemoryAnimalRegistry() = default;

    /**
     * @brief Add a profile, or replace the one with the same id
     *
     * Profiles without a name or with a non-positive weight are rejected.
     * An empty id gets a generated one; species outside speciesList()
     * are stored as "Other".
     *
     * @return false if the profile was rejected
     */
    bool upsert(AnimalProfile profile);

    bool remove(const std::string& id);

    const AnimalProfile* find(const std::string& id) const override;
    std::vector<AnimalProfile> list() const override;

    std::size_t size() const { return animals_.size(); }

    /**
     * @brief Dog, Cat, Horse, Cattle, Other
     */
    static const std::vector<std::string>& speciesList();

private:
    std::vector<AnimalProfile> animals_;
    int next_id_ = 1;

    std::string generateId();
};

} // namespace VetCalc

#endif // ANIMAL_REGISTRY_HPP
