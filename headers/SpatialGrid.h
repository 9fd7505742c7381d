#pragma once
#include <SFML/System/Vector2.hpp>
#include <vector>
#include <unordered_map>
#include <cmath>
#include <cstdint>

class Person;

/**
 * spatial hash grid for neighbor candidate lookup
 * stores person indices per cell; cell size should match the query radius so a
 * query only touches the 3x3 block around the querying cell
 * positions must be kept current (relocate) while persons move during a tick,
 * otherwise queries can miss persons that moved into range
 */
class SpatialGrid
{
public:
    static constexpr size_t ESTIMATED_PERSONS_PER_CELL = 16;

    struct Cell
    {
        std::vector<size_t> personIndices;

        Cell()
        {
            personIndices.reserve(ESTIMATED_PERSONS_PER_CELL);
        }

        void clear()
        {
            personIndices.clear();
        }

        void addPerson(size_t personIndex)
        {
            personIndices.push_back(personIndex);
        }

        void removePerson(size_t personIndex);
    };

private:
    std::unordered_map<uint64_t, Cell> cells_;
    float invCellSize_; // precomputed for faster division

    // packs both cell coordinates into one key, distinct cells never share a key
    static constexpr uint64_t hashPosition(int x, int y)
    {
        return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
               static_cast<uint64_t>(static_cast<uint32_t>(y));
    }

    // convert world position to grid coordinates
    inline std::pair<int, int> worldToGrid(float x, float y) const
    {
        return {
            static_cast<int>(std::floor(x * invCellSize_)),
            static_cast<int>(std::floor(y * invCellSize_))};
    }

public:
    explicit SpatialGrid(float cellSize);
    ~SpatialGrid() = default;

    // core operations
    void clear();
    void insert(size_t personIndex, sf::Vector2f position);
    void relocate(size_t personIndex, sf::Vector2f from, sf::Vector2f to);
    void rebuild(const std::vector<Person> &persons);

    // indices of every person in the cells overlapping the query circle
    // (superset of the persons within radius, callers do the exact check)
    std::vector<size_t> getNeighbors(sf::Vector2f position, float radius) const;

    size_t getTotalEntries() const;
};
