#include "SpatialGrid.h"
#include "Person.h"
#include <algorithm>

void SpatialGrid::Cell::removePerson(size_t personIndex)
{
    auto it = std::find(personIndices.begin(), personIndices.end(), personIndex);
    if (it != personIndices.end())
    {
        personIndices.erase(it);
    }
}

SpatialGrid::SpatialGrid(float cellSize)
    : invCellSize_(1.0f / std::max(1.0f, cellSize))
{
}

void SpatialGrid::clear()
{
    for (auto &[key, cell] : cells_)
    {
        cell.clear();
    }
}

void SpatialGrid::insert(size_t personIndex, sf::Vector2f position)
{
    auto [gridX, gridY] = worldToGrid(position.x, position.y);
    cells_[hashPosition(gridX, gridY)].addPerson(personIndex);
}

void SpatialGrid::relocate(size_t personIndex, sf::Vector2f from, sf::Vector2f to)
{
    auto [fromX, fromY] = worldToGrid(from.x, from.y);
    auto [toX, toY] = worldToGrid(to.x, to.y);
    if (fromX == toX && fromY == toY)
        return;

    auto it = cells_.find(hashPosition(fromX, fromY));
    if (it != cells_.end())
    {
        it->second.removePerson(personIndex);
    }
    cells_[hashPosition(toX, toY)].addPerson(personIndex);
}

void SpatialGrid::rebuild(const std::vector<Person> &persons)
{
    clear();

    for (size_t i = 0; i < persons.size(); ++i)
    {
        insert(i, persons[i].getPosition());
    }
}

std::vector<size_t> SpatialGrid::getNeighbors(sf::Vector2f position, float radius) const
{
    std::vector<size_t> neighbors;
    neighbors.reserve(64);

    int radiusInCells = static_cast<int>(std::ceil(radius * invCellSize_));
    auto [centerX, centerY] = worldToGrid(position.x, position.y);

    for (int dx = -radiusInCells; dx <= radiusInCells; ++dx)
    {
        for (int dy = -radiusInCells; dy <= radiusInCells; ++dy)
        {
            auto it = cells_.find(hashPosition(centerX + dx, centerY + dy));
            if (it != cells_.end())
            {
                const auto &cell = it->second;
                neighbors.insert(neighbors.end(),
                                 cell.personIndices.begin(),
                                 cell.personIndices.end());
            }
        }
    }

    return neighbors;
}

size_t SpatialGrid::getTotalEntries() const
{
    size_t total = 0;
    for (const auto &[key, cell] : cells_)
    {
        total += cell.personIndices.size();
    }
    return total;
}
