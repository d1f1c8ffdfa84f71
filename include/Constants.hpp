#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <SDL2/SDL_log.h>

#include <array>

namespace constants
{
	inline constexpr int log_category = SDL_LOG_CATEGORY_CUSTOM;

	inline constexpr int max_neighbours = 8;

	struct BoardDefinition
	{
		int id;
		const char* name;
		int width;
		int height;
		int mines;
	};

	// Boards 1-5 scale up in difficulty, board 6 is the boss board.
	inline constexpr std::array<BoardDefinition, 6> boards = { {
		{ 1, "Tutorial", 8, 8, 10 },
		{ 2, "Easy", 10, 10, 15 },
		{ 3, "Normal", 12, 12, 25 },
		{ 4, "Hard", 14, 14, 35 },
		{ 5, "Very Hard", 14, 14, 40 },
		{ 6, "Boss", 16, 16, 50 }
	} };

	struct DifficultyPreset
	{
		const char* name;
		double size_scale;
		double mine_scale;
	};

	inline constexpr DifficultyPreset easy_preset = { "Easy", 0.8, 0.8 };
	inline constexpr DifficultyPreset normal_preset = { "Normal", 1.0, 1.0 };
	inline constexpr DifficultyPreset hard_preset = { "Hard", 1.15, 1.2 };

	inline constexpr int default_scale_percent = 100;

	inline constexpr int min_board_dimension = 6;
	inline constexpr int max_board_dimension = 30;
	inline constexpr int min_board_mines = 5;
	inline constexpr int min_safe_cells = 9;

	inline constexpr int default_custom_width = 10;
	inline constexpr int default_custom_height = 10;
	inline constexpr int default_custom_mines = 15;
} // namespace constants

#endif
