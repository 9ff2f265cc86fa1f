#ifndef NODEHUB_BROKER_REGISTRATION_POLICY_H
#define NODEHUB_BROKER_REGISTRATION_POLICY_H

/**
 * What happens when an already registered connection sends another registration.
 */
enum class registration_policy {
	/** overwrite type, name and capabilities of the existing node */
	replace,
	/** refuse the registration, the node keeps its previous state */
	reject
};

#endif // NODEHUB_BROKER_REGISTRATION_POLICY_H
