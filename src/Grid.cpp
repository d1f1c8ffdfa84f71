#include "Grid.hpp"
#include "Constants.hpp"

#include <SDL2/SDL_log.h>

#include <cstdint>
#include <limits>
#include <random>
#include <sstream>
#include <stack>
#include <string>

namespace
{
	std::uint64_t RandomSeed()
	{
		std::random_device random_device;
		return (static_cast<std::uint64_t>(random_device()) << 32) | random_device();
	}
}

Grid::Grid(int width, int height, int mine_count) :
	Grid(GridConfig{ width, height, mine_count }, true, RandomSeed())
{
}

Grid::Grid(int width, int height, int mine_count, std::uint64_t seed) :
	Grid(GridConfig{ width, height, mine_count }, true, seed)
{
}

Grid::Grid(const GridConfig& config) :
	Grid(config, true, RandomSeed())
{
}

Grid::Grid(const GridConfig& config, std::uint64_t seed) :
	Grid(config, true, seed)
{
}

Grid::Grid(const GridConfig& config, bool place_random_mines, std::uint64_t seed) :
	width_(config.width),
	height_(config.height),
	mine_count_(config.mine_count),
	revealed_(0),
	flagged_(0)
{
	if (const std::optional<std::string> error = ValidateGridConfig(config))
	{
		SDL_LogError(constants::log_category, "Grid could not be created! %s", error->c_str());
		throw ConfigurationError(*error);
	}

	GenerateBoard();

	if (!place_random_mines)
	{
		return;
	}

	PlaceMines(seed);
	CalculateNumbers();

	SDL_LogDebug(constants::log_category, "Generated %dx%d grid with %d mines (seed %llu)",
		width_, height_, mine_count_, static_cast<unsigned long long>(seed));
}

Grid Grid::WithMines(int width, int height, const std::vector<CellPosition>& mine_positions)
{
	if (mine_positions.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
	{
		SDL_LogError(constants::log_category, "Grid could not be created! Too many mine positions.");
		throw ConfigurationError("Too many mine positions.");
	}

	Grid grid(GridConfig{ width, height, static_cast<int>(mine_positions.size()) }, false, 0);

	for (const CellPosition& position : mine_positions)
	{
		std::string error;

		if (!grid.IsValid(position.x, position.y))
		{
			error = "Mine position (" + std::to_string(position.x) + ", " + std::to_string(position.y) + ") is outside the grid.";
		}
		else if (grid.board_[grid.Index(position.x, position.y)].mine_)
		{
			error = "Mine position (" + std::to_string(position.x) + ", " + std::to_string(position.y) + ") is listed twice.";
		}

		if (!error.empty())
		{
			SDL_LogError(constants::log_category, "Grid could not be created! %s", error.c_str());
			throw ConfigurationError(error);
		}

		grid.board_[grid.Index(position.x, position.y)].mine_ = true;
	}

	grid.CalculateNumbers();

	return grid;
}

int Grid::Width() const
{
	return width_;
}

int Grid::Height() const
{
	return height_;
}

int Grid::MineCount() const
{
	return mine_count_;
}

int Grid::RevealedCount() const
{
	return revealed_;
}

int Grid::FlaggedCount() const
{
	return flagged_;
}

bool Grid::IsValid(int x, int y) const
{
	return x >= 0 && x < width_ && y >= 0 && y < height_;
}

const Cell* Grid::GetCell(int x, int y) const
{
	if (!IsValid(x, y))
	{
		return nullptr;
	}

	return &board_[Index(x, y)];
}

std::vector<const Cell*> Grid::GetNeighbours(int x, int y) const
{
	std::vector<const Cell*> neighbours;

	if (!IsValid(x, y))
	{
		return neighbours;
	}

	for (std::size_t neighbour_index : GetNeighboursIndices(Index(x, y)))
	{
		neighbours.push_back(&board_[neighbour_index]);
	}

	return neighbours;
}

std::vector<const Cell*> Grid::RevealCell(int x, int y)
{
	std::vector<const Cell*> revealed_cells;

	if (!IsValid(x, y))
	{
		return revealed_cells;
	}

	UncoverCells(Index(x, y), revealed_cells);

	return revealed_cells;
}

bool Grid::ToggleFlag(int x, int y)
{
	if (!IsValid(x, y))
	{
		return false;
	}

	Cell& cell = board_[Index(x, y)];

	if (cell.uncovered_)
	{
		return false;
	}

	if (cell.flag_)
	{
		--flagged_;
		cell.flag_ = false;
	}
	else
	{
		++flagged_;
		cell.flag_ = true;
	}

	return true;
}

std::vector<const Cell*> Grid::Chord(int x, int y)
{
	std::vector<const Cell*> revealed_cells;

	if (!IsValid(x, y))
	{
		return revealed_cells;
	}

	const std::size_t start_index = Index(x, y);
	const Cell& cell = board_[start_index];

	if (!cell.uncovered_ || cell.mines_in_vicinity_ == 0)
	{
		return revealed_cells;
	}

	const std::vector<std::size_t> neighbour_indices = GetNeighboursIndices(start_index);

	int flagged_mines = 0;

	for (std::size_t neighbour_index : neighbour_indices)
	{
		if (board_[neighbour_index].flag_)
		{
			++flagged_mines;
		}
	}

	if (flagged_mines != cell.mines_in_vicinity_)
	{
		return revealed_cells;
	}

	for (std::size_t neighbour_index : neighbour_indices)
	{
		UncoverCells(neighbour_index, revealed_cells);
	}

	return revealed_cells;
}

bool Grid::IsComplete() const
{
	return revealed_ == width_ * height_ - mine_count_;
}

void Grid::RevealAllMines()
{
	for (Cell& cell : board_)
	{
		if (!cell.mine_)
		{
			continue;
		}

		if (cell.flag_)
		{
			cell.flag_ = false;
			--flagged_;
		}

		cell.Uncover();
	}
}

bool Grid::MarkTrap(int x, int y)
{
	if (!IsValid(x, y))
	{
		return false;
	}

	Cell& cell = board_[Index(x, y)];

	if (cell.mine_ || cell.uncovered_)
	{
		return false;
	}

	cell.trap_ = true;
	return true;
}

bool Grid::MarkCursed(int x, int y)
{
	if (!IsValid(x, y))
	{
		return false;
	}

	Cell& cell = board_[Index(x, y)];

	if (cell.mine_ || cell.uncovered_)
	{
		return false;
	}

	cell.cursed_ = true;
	return true;
}

bool Grid::ClearCurse(int x, int y)
{
	if (!IsValid(x, y))
	{
		return false;
	}

	Cell& cell = board_[Index(x, y)];

	if (!cell.cursed_ || cell.uncovered_)
	{
		return false;
	}

	cell.cursed_ = false;
	return true;
}

int Grid::ClearCursesInArea(int center_x, int center_y, int size)
{
	const int radius = size / 2;
	int removed = 0;

	for (int dy = -radius; dy <= radius; ++dy)
	{
		for (int dx = -radius; dx <= radius; ++dx)
		{
			if (ClearCurse(center_x + dx, center_y + dy))
			{
				++removed;
			}
		}
	}

	return removed;
}

std::string Grid::DebugString() const
{
	std::ostringstream out;

	for (std::size_t i = 0; i < board_.size(); ++i)
	{
		if (board_[i].mine_)
		{
			out << "X";
		}
		else
		{
			out << board_[i].mines_in_vicinity_;
		}

		out << ((i + 1) % static_cast<std::size_t>(width_) == 0 ? "\n" : " ");
	}

	return out.str();
}

void Grid::DebugBoard() const
{
	SDL_LogDebug(constants::log_category, "%dx%d grid, %d mines, %d revealed, %d flagged\n%s",
		width_, height_, mine_count_, revealed_, flagged_, DebugString().c_str());
}

std::size_t Grid::Index(int x, int y) const
{
	return static_cast<std::size_t>(y) * width_ + x;
}

void Grid::GenerateBoard()
{
	board_.clear();
	board_.reserve(static_cast<std::size_t>(width_) * height_);

	for (int y = 0; y < height_; ++y)
	{
		for (int x = 0; x < width_; ++x)
		{
			board_.emplace_back(x, y);
		}
	}
}

void Grid::PlaceMines(std::uint64_t seed)
{
	std::mt19937_64 mt{ seed };
	std::uniform_int_distribution<std::size_t> random_index{ 0, board_.size() - 1 };

	int placed = 0;

	while (placed < mine_count_)
	{
		const std::size_t mine_index = random_index(mt);

		if (!board_[mine_index].mine_)
		{
			board_[mine_index].mine_ = true;
			++placed;
		}
	}
}

void Grid::CalculateNumbers()
{
	for (std::size_t i = 0; i < board_.size(); ++i)
	{
		if (board_[i].mine_)
		{
			continue;
		}

		for (std::size_t neighbour_index : GetNeighboursIndices(i))
		{
			if (board_[neighbour_index].mine_)
			{
				++board_[i].mines_in_vicinity_;
			}
		}
	}
}

void Grid::UncoverCell(std::size_t index, std::vector<const Cell*>& revealed_cells)
{
	Cell& cell = board_[index];

	cell.Uncover();

	if (!cell.mine_)
	{
		++revealed_;
	}

	revealed_cells.push_back(&cell);
}

void Grid::UncoverCells(std::size_t start_index, std::vector<const Cell*>& revealed_cells)
{
	const Cell& start_cell = board_[start_index];

	if (start_cell.uncovered_ || start_cell.flag_)
	{
		return;
	}

	UncoverCell(start_index, revealed_cells);

	if (start_cell.mine_ || start_cell.mines_in_vicinity_ != 0)
	{
		return;
	}

	// Cells are uncovered when pushed, so each one enters the stack at most once.
	std::stack<std::size_t> indices_stack;
	indices_stack.push(start_index);

	while (!indices_stack.empty())
	{
		const std::size_t top_index = indices_stack.top();
		indices_stack.pop();

		for (std::size_t neighbour_index : GetNeighboursIndices(top_index))
		{
			const Cell& neighbour = board_[neighbour_index];

			if (neighbour.uncovered_ || neighbour.flag_)
			{
				continue;
			}

			UncoverCell(neighbour_index, revealed_cells);

			if (!neighbour.mine_ && neighbour.mines_in_vicinity_ == 0)
			{
				indices_stack.push(neighbour_index);
			}
		}
	}
}

std::vector<std::size_t> Grid::GetNeighboursIndices(std::size_t cell_index) const
{
	std::vector<std::size_t> result_indices;
	result_indices.reserve(constants::max_neighbours);

	const std::size_t width = static_cast<std::size_t>(width_);
	const Cell& cell = board_[cell_index];

	const bool left_cell_available = cell.x_ > 0;
	const bool right_cell_available = cell.x_ + 1 < width_;
	const bool upper_cell_available = cell.y_ > 0;
	const bool lower_cell_available = cell.y_ + 1 < height_;

	if (left_cell_available)
	{
		result_indices.emplace_back(cell_index - 1);
	}

	if (right_cell_available)
	{
		result_indices.emplace_back(cell_index + 1);
	}

	if (upper_cell_available)
	{
		result_indices.emplace_back(cell_index - width);
	}

	if (lower_cell_available)
	{
		result_indices.emplace_back(cell_index + width);
	}

	if (left_cell_available && upper_cell_available)
	{
		result_indices.emplace_back(cell_index - width - 1);
	}

	if (left_cell_available && lower_cell_available)
	{
		result_indices.emplace_back(cell_index + width - 1);
	}

	if (right_cell_available && upper_cell_available)
	{
		result_indices.emplace_back(cell_index - width + 1);
	}

	if (right_cell_available && lower_cell_available)
	{
		result_indices.emplace_back(cell_index + width + 1);
	}

	return result_indices;
}
