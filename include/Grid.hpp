#ifndef GRID_HPP
#define GRID_HPP

#include "Cell.hpp"
#include "GridConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct CellPosition
{
	int x;
	int y;
};

/*
 * Minesweeper board owning a row-major matrix of cells.
 *
 * Construction throws ConfigurationError for an unusable size or mine count,
 * before any mine is placed. Every other operation is a no-op on bad input:
 * reveals and chords return an empty list, flag and hazard calls return false.
 * Cell pointers handed out stay valid for the lifetime of the grid.
 */
class Grid
{
private:
	int width_;
	int height_;
	int mine_count_;
	int revealed_;
	int flagged_;

	std::vector<Cell> board_;

public:
	Grid(int width, int height, int mine_count);

	Grid(int width, int height, int mine_count, std::uint64_t seed);

	explicit Grid(const GridConfig& config);

	Grid(const GridConfig& config, std::uint64_t seed);

	// Places mines exactly at the given positions instead of at random.
	static Grid WithMines(int width, int height, const std::vector<CellPosition>& mine_positions);

	int Width() const;

	int Height() const;

	int MineCount() const;

	// Non-mine cells revealed so far.
	int RevealedCount() const;

	int FlaggedCount() const;

	bool IsValid(int x, int y) const;

	const Cell* GetCell(int x, int y) const;

	std::vector<const Cell*> GetNeighbours(int x, int y) const;

	/*
	 * Reveals the cell and, when it borders no mine, the whole connected
	 * zero region plus its numbered border. The target cell comes first in
	 * the result. Flagged cells are never revealed and stop the cascade.
	 * A revealed mine is returned like any other cell.
	 */
	std::vector<const Cell*> RevealCell(int x, int y);

	bool ToggleFlag(int x, int y);

	/*
	 * Reveals every unflagged neighbour of a revealed numbered cell, but only
	 * when the number of flagged neighbours equals the cell's number.
	 */
	std::vector<const Cell*> Chord(int x, int y);

	bool IsComplete() const;

	void RevealAllMines();

	bool MarkTrap(int x, int y);

	bool MarkCursed(int x, int y);

	bool ClearCurse(int x, int y);

	int ClearCursesInArea(int center_x, int center_y, int size);

	std::string DebugString() const;

	void DebugBoard() const;

private:
	Grid(const GridConfig& config, bool place_random_mines, std::uint64_t seed);

	std::size_t Index(int x, int y) const;

	void GenerateBoard();

	void PlaceMines(std::uint64_t seed);

	void CalculateNumbers();

	void UncoverCell(std::size_t index, std::vector<const Cell*>& revealed_cells);

	void UncoverCells(std::size_t start_index, std::vector<const Cell*>& revealed_cells);

	std::vector<std::size_t> GetNeighboursIndices(std::size_t cell_index) const;
};

#endif
