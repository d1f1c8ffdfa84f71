#include "Grid.hpp"

#include <SDL2/SDL_log.h>

#include <cstdio>
#include <vector>

static int fail(const char* msg)
{
	std::fprintf(stderr, "FAIL: %s\n", msg ? msg : "(null)");
	return 1;
}

static Grid corner_mines()
{
	return Grid::WithMines(5, 5, { { 0, 0 }, { 4, 0 }, { 0, 4 }, { 4, 4 } });
}

static int count_revealed_mines(const Grid& grid)
{
	int mines = 0;

	for (int y = 0; y < grid.Height(); ++y)
	{
		for (int x = 0; x < grid.Width(); ++x)
		{
			const Cell* cell = grid.GetCell(x, y);

			if (cell->mine_ && cell->uncovered_)
			{
				++mines;
			}
		}
	}

	return mines;
}

int main()
{
	SDL_LogSetAllPriority(SDL_LOG_PRIORITY_DEBUG);

	{
		Grid grid = Grid::WithMines(3, 3, { { 0, 0 } });

		if (grid.IsComplete())
		{
			return fail("fresh_grid_incomplete");
		}

		if (grid.RevealCell(2, 2).size() != 8 || !grid.IsComplete() || grid.FlaggedCount() != 0)
		{
			return fail("complete_without_flags");
		}
	}

	{
		Grid grid = Grid::WithMines(3, 3, { { 0, 0 } });

		grid.ToggleFlag(0, 0);
		grid.RevealCell(2, 2);

		if (!grid.IsComplete() || grid.FlaggedCount() != 1)
		{
			return fail("complete_with_mine_flagged");
		}
	}

	{
		Grid grid = Grid::WithMines(3, 3, { { 0, 0 } });

		grid.ToggleFlag(1, 0);
		grid.RevealCell(2, 2);

		if (grid.IsComplete() || grid.RevealedCount() != 7)
		{
			return fail("safe_cell_flagged_blocks_completion");
		}

		grid.ToggleFlag(1, 0);
		grid.RevealCell(1, 0);

		if (!grid.IsComplete())
		{
			return fail("complete_after_unflag");
		}
	}

	{
		Grid grid(2, 1, 0, 3);

		if (grid.IsComplete() || grid.RevealCell(0, 0).size() != 2 || !grid.IsComplete())
		{
			return fail("mine_free_grid");
		}
	}

	{
		Grid grid = corner_mines();

		grid.RevealCell(1, 0);
		grid.ToggleFlag(4, 4);
		grid.RevealAllMines();

		if (count_revealed_mines(grid) != 4 || grid.RevealedCount() != 1)
		{
			return fail("reveal_all_mines");
		}

		if (grid.GetCell(4, 4)->flag_ || grid.FlaggedCount() != 0)
		{
			return fail("reveal_all_mines_clears_flags");
		}

		if (grid.GetCell(2, 0)->uncovered_ || grid.IsComplete())
		{
			return fail("reveal_all_mines_leaves_safe_cells");
		}

		grid.RevealAllMines();

		if (count_revealed_mines(grid) != 4 || grid.RevealedCount() != 1 || grid.FlaggedCount() != 0)
		{
			return fail("reveal_all_mines_idempotent");
		}

		if (!grid.RevealCell(0, 0).empty() || grid.ToggleFlag(0, 0))
		{
			return fail("revealed_mine_is_terminal");
		}
	}

	{
		Grid grid = corner_mines();

		if (grid.MarkTrap(0, 0) || grid.MarkCursed(4, 4))
		{
			return fail("hazard_on_mine_refused");
		}

		if (!grid.MarkTrap(2, 1) || !grid.GetCell(2, 1)->trap_ || grid.GetCell(2, 1)->mines_in_vicinity_ != 0)
		{
			return fail("mark_trap");
		}

		if (!grid.MarkCursed(1, 1) || !grid.MarkCursed(3, 3) || !grid.MarkCursed(2, 4) || !grid.GetCell(1, 1)->cursed_)
		{
			return fail("mark_cursed");
		}

		if (grid.MarkTrap(5, 0) || grid.MarkCursed(0, -1) || grid.ClearCurse(9, 9))
		{
			return fail("hazard_out_of_bounds");
		}

		if (grid.ClearCurse(2, 2))
		{
			return fail("clear_curse_on_clean_cell");
		}

		if (grid.ClearCursesInArea(2, 2, 3) != 2 || grid.GetCell(1, 1)->cursed_ || !grid.GetCell(2, 4)->cursed_)
		{
			return fail("clear_curses_in_area");
		}

		grid.RevealCell(2, 4);

		if (grid.ClearCurse(2, 4) || !grid.GetCell(2, 4)->cursed_ || grid.MarkTrap(2, 4))
		{
			return fail("revealed_hazards_fixed");
		}

		if (grid.RevealedCount() != 21 || !grid.IsComplete())
		{
			return fail("hazards_do_not_affect_completion");
		}

		grid.DebugBoard();
	}

	std::printf("grid_completion_test: OK\n");
	return 0;
}
