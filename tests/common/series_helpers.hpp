#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace tests::helpers {

constexpr double kPi = 3.14159265358979323846;

inline std::vector<double> linearSeries(double start, double step, std::size_t count) {
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		values.push_back(start + static_cast<double>(i) * step);
	}
	return values;
}

inline std::vector<double> sineWave(std::size_t length, std::size_t period, double amplitude = 1.0,
                                    double level = 0.0) {
	std::vector<double> data(length);
	for (std::size_t i = 0; i < length; ++i) {
		const double angle = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(period);
		data[i] = level + amplitude * std::sin(angle);
	}
	return data;
}

/// Approximately Gaussian noise (sum of four centred uniforms) from a fixed-seed std::mt19937.
inline std::vector<double> noise(std::size_t length, std::uint32_t seed) {
	std::mt19937 engine(seed);
	std::vector<double> data(length);
	for (std::size_t i = 0; i < length; ++i) {
		double sum = 0.0;
		for (int k = 0; k < 4; ++k) {
			sum += static_cast<double>(engine()) / 4294967296.0 - 0.5;
		}
		data[i] = sum;
	}
	return data;
}

inline std::vector<double> cumulativeSum(const std::vector<double> &data) {
	std::vector<double> result(data.size());
	double running = 0.0;
	for (std::size_t i = 0; i < data.size(); ++i) {
		running += data[i];
		result[i] = running;
	}
	return result;
}

inline std::vector<double> randomWalk(std::size_t length, std::uint32_t seed) {
	return cumulativeSum(noise(length, seed));
}

} // namespace tests::helpers
