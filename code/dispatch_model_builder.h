/*
 * dispatch_model_builder.h
 *
 * This file contains the functions that translate one dispatch
 * horizon and an asset configuration into a MILP.
 *
 */

#ifndef DISPATCH_MODEL_BUILDER_H
#define DISPATCH_MODEL_BUILDER_H

#include <vector>

#include "asset_config.h"
#include "dispatch_types.h"
#include "errors.h"
#include "milp_model.h"

namespace DispatchOptimization {

    /**
     * Positions of the variable blocks (v_pos_*) and constraint blocks (r_pos_*)
     * inside a model built by buildDispatchModel().
     * Every block has one entry per hour, i.e. the variable of hour h of
     * block X is found at v_pos_X_start + h.
     */
    struct DispatchModelLayout {
        unsigned long n_hours = 0;
        unsigned long v_pos_diesel_output_start = 0; ///< Diesel generator output in kW
        unsigned long v_pos_diesel_on_start     = 0; ///< Binary on/off state of the diesel generator
        unsigned long v_pos_bs_charge_start     = 0; ///< Battery charging power in kW
        unsigned long v_pos_bs_discharge_start  = 0; ///< Battery discharging power in kW
        unsigned long v_pos_solar_used_start    = 0; ///< Used solar power in kW
        unsigned long v_pos_soc_start           = 0; ///< Battery state of charge at the end of the hour in kWh
        unsigned long v_pos_charge_mode_start   = 0; ///< Binary charge mode, only valid if has_charge_mode is true
        bool has_charge_mode = false;
        unsigned long r_pos_balance_start       = 0;
        unsigned long r_pos_diesel_min_start    = 0;
        unsigned long r_pos_diesel_max_start    = 0;
        unsigned long r_pos_soc_start           = 0;
        unsigned long r_pos_charge_mode_start   = 0; ///< Only valid if has_charge_mode is true
        unsigned long r_pos_discharge_mode_start= 0; ///< Only valid if has_charge_mode is true
        unsigned long r_pos_terminal_soc        = 0;
    };

    /**
     * Builds the dispatch MILP for the given horizon into the (empty) model.
     *
     * Variables per hour: diesel output, diesel on, battery charge, battery discharge,
     * used solar, state of charge (and the charge mode, if selected).
     * Constraints per hour: energy balance, diesel min. stable load and capacity (both gated
     * by the on-variable), SoC continuity, exclusive charging / discharging.
     * Once per horizon: terminal SoC >= initial SoC.
     *
     * The constant part of the curtailment penalty is stored as objective offset,
     * so that the objective value of the model equals the total cost.
     *
     * Throws a ConfigurationError if the input is not valid.
     *
     * @param input: The load and solar series
     * @param config: The validated asset configuration
     * @param model: Reference to an empty model
     *
     * @return: Returns the positions of all variable and constraint blocks
     */
    DispatchModelLayout buildDispatchModel(const HorizonInput& input, const AssetConfig& config, MilpModel& model);

    /**
     * Checks hour by hour if the asset limits can cover the input at all.
     * This is used to describe why a model is infeasible:
     * - capacity shortfall: load > diesel capacity + max. discharge + available solar
     * - diesel min. load: the diesel has to run, but its minimum stable output exceeds
     *   load + max. charge power (the surplus can not be absorbed)
     * If no hour-level cause is found, a hint on the terminal SoC requirement is returned.
     */
    std::vector<InfeasibilityHint> findInfeasibilityHints(const HorizonInput& input, const AssetConfig& config);

}

#endif
