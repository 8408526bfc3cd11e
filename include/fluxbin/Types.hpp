#pragma once
#include <Eigen/Dense>
#include <Eigen/SparseCore>
namespace fluxbin {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
	using SparseMatrix = Eigen::SparseMatrix<double, Eigen::RowMajor>;
} // namespace fluxbin
