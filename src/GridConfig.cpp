#include "GridConfig.hpp"
#include "Constants.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace
{
	struct DifficultyScale
	{
		double size_scale;
		double mine_scale;
	};

	DifficultyScale GetDifficultyScale(const DifficultySettings& settings)
	{
		if (const std::optional<constants::DifficultyPreset> preset = GetDifficultyPreset(settings.difficulty))
		{
			return { preset->size_scale, preset->mine_scale };
		}

		const int size_percent = settings.board_size_scale > 0 ? settings.board_size_scale : constants::default_scale_percent;
		const int mine_percent = settings.mine_density_scale > 0 ? settings.mine_density_scale : constants::default_scale_percent;

		return { size_percent / 100.0, mine_percent / 100.0 };
	}

	// Clamped as double so huge scales never overflow int.
	int ClampDimension(double value)
	{
		return static_cast<int>(std::lround(std::clamp<double>(value, constants::min_board_dimension, constants::max_board_dimension)));
	}

	int ClampMines(double value, int total_cells)
	{
		const double max_mines = total_cells - constants::min_safe_cells;
		return static_cast<int>(std::lround(std::max<double>(constants::min_board_mines, std::min(max_mines, value))));
	}
}

std::optional<std::string> ValidateGridConfig(const GridConfig& config)
{
	if (config.width <= 0)
	{
		return "Invalid grid width: " + std::to_string(config.width) + ". Must be a positive integer.";
	}

	if (config.height <= 0)
	{
		return "Invalid grid height: " + std::to_string(config.height) + ". Must be a positive integer.";
	}

	const std::int64_t total_cells = static_cast<std::int64_t>(config.width) * config.height;

	if (total_cells > std::numeric_limits<int>::max())
	{
		return "Grid size " + std::to_string(config.width) + "x" + std::to_string(config.height) + " is too large.";
	}

	if (config.mine_count < 0)
	{
		return "Invalid mine count: " + std::to_string(config.mine_count) + ". Must be a non-negative integer.";
	}

	// At least one safe cell must be left beside the last mine.
	if (config.mine_count >= total_cells - 1)
	{
		const std::int64_t max_mines = std::max<std::int64_t>(0, total_cells - 2);

		return "Too many mines (" + std::to_string(config.mine_count) + ") for grid size " +
			std::to_string(config.width) + "x" + std::to_string(config.height) + " (" + std::to_string(total_cells) + " cells). " +
			"Maximum mines: " + std::to_string(max_mines) + ".";
	}

	return std::nullopt;
}

std::optional<GridConfig> GetBoardConfig(int board_number)
{
	if (board_number < 1 || board_number > GetTotalBoards())
	{
		return std::nullopt;
	}

	const constants::BoardDefinition& board = constants::boards[board_number - 1];

	return GridConfig{ board.width, board.height, board.mines };
}

int GetTotalBoards()
{
	return static_cast<int>(constants::boards.size());
}

bool IsBossBoard(int board_number)
{
	return board_number == GetTotalBoards();
}

std::optional<GridConfig> GetScaledBoardConfig(int board_number, const DifficultySettings& settings)
{
	const std::optional<GridConfig> base_config = GetBoardConfig(board_number);

	if (!base_config)
	{
		return std::nullopt;
	}

	if (settings.difficulty == Difficulty::CUSTOM && settings.use_custom_dimensions)
	{
		const int custom_width = ClampDimension(settings.custom_width > 0 ? settings.custom_width : constants::default_custom_width);
		const int custom_height = ClampDimension(settings.custom_height > 0 ? settings.custom_height : constants::default_custom_height);
		const int total_cells = custom_width * custom_height;
		const int custom_mines = ClampMines(settings.custom_mines > 0 ? settings.custom_mines : constants::default_custom_mines, total_cells);

		return GridConfig{ custom_width, custom_height, custom_mines };
	}

	const DifficultyScale scale = GetDifficultyScale(settings);

	const int scaled_width = ClampDimension(std::round(base_config->width * scale.size_scale));
	const int scaled_height = ClampDimension(std::round(base_config->height * scale.size_scale));

	const int total_cells = scaled_width * scaled_height;
	const double base_density = static_cast<double>(base_config->mine_count) / (base_config->width * base_config->height);
	const int scaled_mines = ClampMines(std::round(total_cells * base_density * scale.mine_scale), total_cells);

	return GridConfig{ scaled_width, scaled_height, scaled_mines };
}

std::optional<constants::DifficultyPreset> GetDifficultyPreset(Difficulty difficulty)
{
	switch (difficulty)
	{
	case Difficulty::EASY:
		return constants::easy_preset;
	case Difficulty::NORMAL:
		return constants::normal_preset;
	case Difficulty::HARD:
		return constants::hard_preset;
	case Difficulty::CUSTOM:
		break;
	}

	return std::nullopt;
}

CustomBoardValidation ValidateCustomBoard(int width, int height, int mines)
{
	const std::int64_t total_cells = static_cast<std::int64_t>(width) * height;

	CustomBoardValidation result;
	result.min_width = constants::min_board_dimension;
	result.max_width = constants::max_board_dimension;
	result.min_height = constants::min_board_dimension;
	result.max_height = constants::max_board_dimension;
	result.min_mines = constants::min_board_mines;
	result.max_mines = static_cast<int>(std::clamp<std::int64_t>(total_cells - constants::min_safe_cells,
		std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
	result.density_percent = total_cells > 0 ? static_cast<int>(std::lround(100.0 * mines / total_cells)) : 0;

	result.is_valid = width >= result.min_width && width <= result.max_width &&
		height >= result.min_height && height <= result.max_height &&
		mines >= result.min_mines && mines <= result.max_mines;

	return result;
}
