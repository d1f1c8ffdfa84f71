#ifndef GRID_CONFIG_HPP
#define GRID_CONFIG_HPP

#include "Constants.hpp"

#include <optional>
#include <stdexcept>
#include <string>

class ConfigurationError : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

struct GridConfig
{
	int width;
	int height;
	int mine_count;
};

enum class Difficulty
{
	EASY, NORMAL, HARD, CUSTOM
};

struct DifficultySettings
{
	Difficulty difficulty = Difficulty::NORMAL;

	// Percentages, only read for CUSTOM without custom dimensions. Zero means 100.
	int board_size_scale = 100;
	int mine_density_scale = 100;

	bool use_custom_dimensions = false;
	int custom_width = 0;
	int custom_height = 0;
	int custom_mines = 0;
};

/* Returns the reason the config is unusable, or nothing when a grid can be built from it. */
std::optional<std::string> ValidateGridConfig(const GridConfig& config);

std::optional<GridConfig> GetBoardConfig(int board_number);

int GetTotalBoards();

bool IsBossBoard(int board_number);

std::optional<GridConfig> GetScaledBoardConfig(int board_number, const DifficultySettings& settings);

// Nothing for CUSTOM, which has no fixed scales.
std::optional<constants::DifficultyPreset> GetDifficultyPreset(Difficulty difficulty);

struct CustomBoardValidation
{
	bool is_valid;
	int min_width;
	int max_width;
	int min_height;
	int max_height;
	int min_mines;
	int max_mines;
	int density_percent;
};

/* Checks hand-entered board dimensions against the limits the settings screen allows. */
CustomBoardValidation ValidateCustomBoard(int width, int height, int mines);

#endif
